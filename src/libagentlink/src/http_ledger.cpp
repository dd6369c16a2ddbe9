#include "agentlink/http_ledger.hpp"
#include "agentlink/json_util.hpp"
#include "agentlink/log.hpp"
#include <curl/curl.h>
#include <sodium.h>
#include <memory>
#include <mutex>

namespace agentlink {

namespace {

std::once_flag curl_init_flag;

// Callback for libcurl to write response data
size_t write_response(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), realsize);
    return realsize;
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::string to_base64(const std::vector<uint8_t>& bytes) {
    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(bytes.size(), variant), '\0');
    sodium_bin2base64(&out[0], out.size(), bytes.data(), bytes.size(), variant);
    out.resize(out.size() - 1);   // drop the terminating NUL
    return out;
}

// Gateway status text, falling back to the HTTP code.
std::string error_status(const Json::Value& response, long http_code) {
    if (response.isObject()) {
        for (const char* key : {"error", "status", "detail"}) {
            if (response[key].isString()) return response[key].asString();
        }
    }
    return "HTTP_" + std::to_string(http_code);
}

} // namespace

std::string escape_path_segment(const std::string& segment) {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
        throw LedgerError("TRANSPORT_ERROR: curl_easy_init failed");

    char* escaped = curl_easy_escape(curl.get(), segment.data(), static_cast<int>(segment.size()));
    if (!escaped)
        throw LedgerError("TRANSPORT_ERROR: cannot escape '" + segment + "'");
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

HttpLedger::HttpLedger(const Options& options)
    : options_(options) {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    while (!options_.base_url.empty() && options_.base_url.back() == '/')
        options_.base_url.pop_back();

    if (!options_.operator_key_hex.empty()) {
        try {
            operator_key_ = KeyPair::from_hex(options_.operator_key_hex);
        } catch (const std::exception& e) {
            log::error("HttpLedger", std::string("Invalid operator key: ") + e.what());
        }
    }

    log::info("HttpLedger", "Gateway " + options_.base_url + " network " + options_.network);
}

HttpLedger::~HttpLedger() = default;

bool HttpLedger::configured() const {
    return !options_.base_url.empty() && !options_.operator_id.empty() && operator_key_.has_value();
}

std::string HttpLedger::create_topic(const std::string& memo,
                                     const std::optional<KeyPolicy>& admin_key,
                                     const std::optional<KeyPolicy>& submit_key) {
    Json::Value body(Json::objectValue);
    body["memo"] = memo;
    if (admin_key) body["admin_key"] = admin_key->to_json();
    if (submit_key) body["submit_key"] = submit_key->to_json();

    Json::Value response = post_json("/topics", body);
    if (!response["topic_id"].isString() || response["topic_id"].asString().empty())
        throw LedgerError("INVALID_RESPONSE: missing topic_id");
    return response["topic_id"].asString();
}

SubmitReceipt HttpLedger::submit_message(const std::string& topic_id,
                                         const std::vector<uint8_t>& payload,
                                         const std::string& transaction_memo) {
    Json::Value body(Json::objectValue);
    Json::Value message;
    if (parse_json(std::string(payload.begin(), payload.end()), message) && message.isObject()) {
        body["message"] = message;
    } else {
        body["message"] = to_base64(payload);
        body["encoding"] = "base64";
    }
    body["transaction_memo"] = transaction_memo;

    Json::Value response = post_json("/topics/" + escape_path_segment(topic_id) + "/messages", body);
    if (!response["sequence_number"].isIntegral())
        throw LedgerError("INVALID_RESPONSE: missing sequence_number");

    SubmitReceipt receipt;
    receipt.sequence_number = response["sequence_number"].asUInt64();
    receipt.transaction_id = response["transaction_id"].asString();
    return receipt;
}

Json::Value HttpLedger::post_json(const std::string& path, const Json::Value& body) {
    if (!configured()) throw LedgerError("CLIENT_NOT_CONFIGURED");

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) throw LedgerError("TRANSPORT_ERROR: failed to initialize curl");

    const std::string url = options_.base_url + path;
    const std::string request = write_json(body);
    const std::vector<uint8_t> request_bytes(request.begin(), request.end());
    const std::string signature = to_hex(operator_key_->sign(request_bytes));

    curl_slist* raw_headers = nullptr;
    for (const std::string& h : {std::string("Content-Type: application/json"),
                                 "X-Operator-Id: " + options_.operator_id,
                                 "X-Network: " + options_.network,
                                 "X-Public-Key: " + operator_key_->public_key_hex(),
                                 "X-Signature: " + signature}) {
        curl_slist* next = curl_slist_append(raw_headers, h.c_str());
        if (!next) {
            curl_slist_free_all(raw_headers);
            throw LedgerError("TRANSPORT_ERROR: out of memory");
        }
        raw_headers = next;
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    std::string response_text;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_response);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_text);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        log::error("HttpLedger", std::string("curl_easy_perform() failed: ") + curl_easy_strerror(res));
        throw LedgerError(std::string("TRANSPORT_ERROR: ") + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    Json::Value response;
    bool parsed = parse_json(response_text, response);

    if (http_code < 200 || http_code >= 300) {
        log::error("HttpLedger", "HTTP error code: " + std::to_string(http_code) + " for " + path);
        throw LedgerError(error_status(parsed ? response : Json::Value(), http_code));
    }
    if (!parsed || !response.isObject()) {
        throw LedgerError("INVALID_RESPONSE: body is not a JSON object");
    }
    if (response["success"].isBool() && !response["success"].asBool()) {
        throw LedgerError(error_status(response, http_code));
    }
    return response;
}

} // namespace agentlink
