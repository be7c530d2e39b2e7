#include "broker/Checksum.hpp"
#include "common/Json.hpp"
#include "common/Utils.hpp"
#include <curl/curl.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

// Manual check of broker credentials and request signing, outside the gateway.
// Usage: session_probe [key_file.json]
// The key file holds {"api_key": "...", "api_secret": "...", "session_token": "..."}.

namespace {

    const std::string kBaseUrl = "https://api.icicidirect.com/breezeapi/api/v1/";

    std::string read_file(const std::string& path) {
        std::ifstream t(path);
        std::stringstream buffer;
        buffer << t.rdbuf();
        return buffer.str();
    }

    size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
        return size * nmemb;
    }

    // GET with a JSON body, as the broker API expects. Returns the HTTP status, or -1.
    long send_request(const std::string& endpoint, const std::string& body, std::string& response,
                      const std::string& app_key = "", const std::string& secret = "",
                      const std::string& session_token = "") {
        CURL* curl = curl_easy_init();
        if (!curl) {
            std::cerr << "curl_easy_init() failed" << std::endl;
            return -1;
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        if (!app_key.empty()) {
            std::string timestamp = optgate::broker_timestamp();
            std::string checksum = "X-Checksum: token " + optgate::broker_checksum(timestamp, body, secret);
            std::string ts_header = "X-Timestamp: " + timestamp;
            std::string key_header = "X-AppKey: " + app_key;
            std::string token_header = "X-SessionToken: " + session_token;
            headers = curl_slist_append(headers, checksum.c_str());
            headers = curl_slist_append(headers, ts_header.c_str());
            headers = curl_slist_append(headers, key_header.c_str());
            headers = curl_slist_append(headers, token_header.c_str());
        }

        std::string url = kBaseUrl + endpoint;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "GET");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);

        std::cout << "Sending GET " << url << "..." << std::endl;
        long status = -1;
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            std::cerr << "curl_easy_perform() failed: " << curl_easy_strerror(res) << std::endl;
        } else {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return status;
    }

}

int main(int argc, char** argv) {
    try {
        std::string key_file_path = argc > 1 ? argv[1] : "../private/broker_key.json";
        std::cout << "Loading credentials from: " << key_file_path << std::endl;
        std::string json_content = read_file(key_file_path);
        if (json_content.empty()) {
            std::cerr << "Failed to read key file or file is empty." << std::endl;
            return 1;
        }

        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        simdjson::dom::object keys;
        if (optgate::json::parse(parser, json_content, doc) != simdjson::SUCCESS ||
            doc.get(keys) != simdjson::SUCCESS) {
            std::cerr << "Key file is not a JSON object." << std::endl;
            return 1;
        }
        std::string api_key = optgate::json::string_field(keys, "api_key").value_or("");
        std::string api_secret = optgate::json::string_field(keys, "api_secret").value_or("");
        std::string token = optgate::json::string_field(keys, "session_token").value_or("");
        if (api_key.empty() || api_secret.empty() || token.empty()) {
            std::cerr << "Key file needs api_key, api_secret and session_token." << std::endl;
            return 1;
        }

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // 1. Exchange the login token for a session token (unsigned call).
        std::string details;
        std::string body = "{\"SessionToken\":" + optgate::utils::json_string(token) +
                           ",\"AppKey\":" + optgate::utils::json_string(api_key) + "}";
        long status = send_request("customerdetails", body, details);
        std::cout << "Status Code: " << status << std::endl;
        std::cout << "Response Body: " << details << std::endl;

        simdjson::dom::parser details_parser;
        simdjson::dom::element details_doc;
        simdjson::dom::object success;
        std::string session_token;
        if (optgate::json::parse(details_parser, details, details_doc) == simdjson::SUCCESS &&
            details_doc["Success"].get(success) == simdjson::SUCCESS) {
            session_token = optgate::json::string_field(success, "session_token").value_or("");
        }
        if (session_token.empty()) {
            std::cerr << "No session_token in response; the login token is probably stale." << std::endl;
            curl_global_cleanup();
            return 1;
        }

        // 2. One signed call.
        std::string funds;
        status = send_request("funds", "{}", funds, api_key, api_secret, session_token);
        std::cout << "Status Code: " << status << std::endl;
        std::cout << "Response Body: " << funds << std::endl;

        curl_global_cleanup();
        return status == 200 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
