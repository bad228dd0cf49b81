#include "HttpClient.h"
#include "Log.h"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <curl/curl.h>

static size_t curlWriteCB_(char* ptr, size_t size, size_t nmemb, void* userdata) {
	auto* s = static_cast<std::string*>(userdata);
	s->append(ptr, size * nmemb);
	return size * nmemb;
}

bool HttpClient::globalInit() {
	CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
	if (rc != CURLE_OK) {
		LOG_ERROR("Http", std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
		return false;
	}
	return true;
}

void HttpClient::globalCleanup() {
	curl_global_cleanup();
}

HttpClient::Transport HttpClient::request(const std::string& method,
	const std::string& url,
	const std::string& body,
	const std::vector<std::string>& headers,
	long timeoutSec,
	HttpResponse& out,
	std::string& err) {
	out = HttpResponse{};

	CURL* curl = curl_easy_init();
	if (!curl) { err = "curl_easy_init failed"; return Transport::Failed; }

	struct curl_slist* hdrs = nullptr;
	for (const auto& h : headers) hdrs = curl_slist_append(hdrs, h.c_str());

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_USERAGENT, "StandingsWatch/1.0");
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCB_);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSec);
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 6L);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // safer in multithreaded apps
	if (hdrs) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);

	if (method == "POST") {
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
	}
	else if (method != "GET") {
		curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
		if (!body.empty()) {
			curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
			curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
		}
	}

	CURLcode rc = curl_easy_perform(curl);
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);

	curl_slist_free_all(hdrs);
	curl_easy_cleanup(curl);

	if (rc == CURLE_OK) return Transport::Ok;

	err = curl_easy_strerror(rc);
	switch (rc) {
	case CURLE_COULDNT_RESOLVE_HOST:
	case CURLE_COULDNT_RESOLVE_PROXY:
	case CURLE_COULDNT_CONNECT:
		return Transport::Unreachable;
	case CURLE_OPERATION_TIMEDOUT:
		return Transport::Timeout;
	default:
		return Transport::Failed;
	}
}

std::string HttpClient::urlEncode(const std::string& s) {
	std::ostringstream oss;
	for (unsigned char c : s) {
		if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') oss << c;
		else { oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << (int)c << std::nouppercase << std::dec; }
	}
	return oss.str();
}
