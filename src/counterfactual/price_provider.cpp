#include "counterfactual/price_provider.h"

#include <cmath>

#include <curl/curl.h>

#include "core/json_utils.h"

namespace adaptive_engine {

namespace {

constexpr const char* kSymbolPlaceholder = "{symbol}";

std::string CurlCodeToString(CURLcode code) {
  return std::string(curl_easy_strerror(code));
}

std::size_t WriteToString(char* ptr, std::size_t size, std::size_t nmemb,
                          void* userdata) {
  if (ptr == nullptr || userdata == nullptr) {
    return 0;
  }
  std::string* out = static_cast<std::string*>(userdata);
  const std::size_t total = size * nmemb;
  out->append(ptr, total);
  return total;
}

}  // namespace

HttpResponse CurlHttpTransport::Get(const std::string& url, int timeout_ms) const {
  // 进程级初始化一次，后续请求复用。
  static const bool kCurlGlobalInit = []() {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
  }();

  HttpResponse out;
  if (!kCurlGlobalInit) {
    out.error = "curl_global_init 失败";
    return out;
  }

  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    out.error = "curl_easy_init 失败";
    return out;
  }

  std::string response_body;
  char curl_error[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curl_error);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "adaptive-engine/0.1");
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

  const CURLcode code = curl_easy_perform(curl);
  long status_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

  out.status_code = static_cast<int>(status_code);
  out.body = std::move(response_body);
  if (code != CURLE_OK) {
    const std::string detailed =
        (curl_error[0] != '\0') ? std::string(curl_error) : CurlCodeToString(code);
    out.error = "curl_easy_perform 失败: " + detailed;
  }

  curl_easy_cleanup(curl);
  return out;
}

HttpPriceProvider::HttpPriceProvider(std::string url_template,
                                     std::string json_field,
                                     int timeout_ms,
                                     std::unique_ptr<HttpTransport> transport)
    : url_template_(std::move(url_template)),
      json_field_(std::move(json_field)),
      timeout_ms_(timeout_ms),
      transport_(std::move(transport)) {}

bool HttpPriceProvider::IsValidSymbol(const std::string& symbol) {
  if (symbol.empty()) {
    return false;
  }
  for (const char c : symbol) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

bool HttpPriceProvider::FetchPrice(const std::string& symbol,
                                   double* out_price,
                                   std::string* out_error) const {
  if (out_price == nullptr || transport_ == nullptr) {
    if (out_error != nullptr) {
      *out_error = "价格查询参数为空";
    }
    return false;
  }
  if (!IsValidSymbol(symbol)) {
    if (out_error != nullptr) {
      *out_error = "交易对非法: " + symbol;
    }
    return false;
  }

  std::string url = url_template_;
  const auto pos = url.find(kSymbolPlaceholder);
  if (pos != std::string::npos) {
    url.replace(pos, std::char_traits<char>::length(kSymbolPlaceholder), symbol);
  }

  const HttpResponse response = transport_->Get(url, timeout_ms_);
  if (!response.error.empty()) {
    if (out_error != nullptr) {
      *out_error = response.error;
    }
    return false;
  }
  if (response.status_code < 200 || response.status_code >= 300) {
    if (out_error != nullptr) {
      *out_error = "价格接口 HTTP 状态异常: " + std::to_string(response.status_code);
    }
    return false;
  }

  JsonValue root;
  std::string parse_error;
  if (!ParseJson(response.body, &root, &parse_error)) {
    if (out_error != nullptr) {
      *out_error = "价格接口响应 JSON 解析失败: " + parse_error;
    }
    return false;
  }
  const auto price = JsonAsNumber(JsonFindDottedPath(&root, json_field_));
  if (!price.has_value() || !std::isfinite(*price) || *price <= 0.0) {
    if (out_error != nullptr) {
      *out_error = "价格接口响应缺少有效字段: " + json_field_;
    }
    return false;
  }
  *out_price = *price;
  return true;
}

}  // namespace adaptive_engine
