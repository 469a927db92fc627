#pragma once

#include <memory>
#include <string>
#include <utility>

namespace adaptive_engine {

/// HTTP 响应统一结构，便于 mock 与真实传输层复用。
struct HttpResponse {
  int status_code{0};
  std::string body;
  std::string error;
};

/**
 * @brief HTTP 传输抽象
 *
 * 业务层不直接依赖 libcurl，单元测试可注入 mock transport。
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse Get(const std::string& url, int timeout_ms) const = 0;
};

class CurlHttpTransport final : public HttpTransport {
 public:
  /// 使用 libcurl 发送 GET 请求。
  HttpResponse Get(const std::string& url, int timeout_ms) const override;
};

/// 现价查询接口：反事实追踪只依赖它，不关心具体行情服务。
class PriceProvider {
 public:
  virtual ~PriceProvider() = default;
  virtual bool FetchPrice(const std::string& symbol,
                          double* out_price,
                          std::string* out_error) const = 0;
};

/**
 * @brief 基于 HTTP + JSON 的现价查询
 *
 * URL 模板中的 `{symbol}` 替换为交易对，响应按点分路径取价格字段
 * （数值或数字字符串均可）。
 */
class HttpPriceProvider final : public PriceProvider {
 public:
  HttpPriceProvider(std::string url_template,
                    std::string json_field,
                    int timeout_ms,
                    std::unique_ptr<HttpTransport> transport =
                        std::make_unique<CurlHttpTransport>());

  bool FetchPrice(const std::string& symbol,
                  double* out_price,
                  std::string* out_error) const override;

  /// 仅允许 [A-Za-z0-9._-]，避免拼出非法 URL。
  static bool IsValidSymbol(const std::string& symbol);

 private:
  std::string url_template_;
  std::string json_field_;
  int timeout_ms_{5000};
  std::unique_ptr<HttpTransport> transport_;
};

}  // namespace adaptive_engine
