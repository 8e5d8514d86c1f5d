#include "http_puller.hpp"
#include "lib_utils/format.hpp"
#include <stdexcept>
#include <memory>
#include <string>

extern "C" {
#include <curl/curl.h>
}

namespace Media {

namespace {

struct HttpSource : Captioner::IFilePuller {

	HttpSource() : curl(curl_easy_init()) {
		if(!curl)
			throw std::runtime_error("can't init curl");
	}

	~HttpSource() {
		curl_easy_cleanup(curl);
	}

	void wget(const char* url, std::function<void(SpanC)> callback) override {
		struct HttpContext {
			std::function<void(SpanC)> userCallback;
			std::string callbackError;

			static size_t curlCallback(void *stream, size_t size, size_t nmemb, void *ptr) {
				auto pThis = (HttpContext*)ptr;
				auto const bytes = size * nmemb;
				// exceptions must not cross libcurl: abort the transfer instead
				try {
					pThis->userCallback({(const uint8_t*)stream, bytes});
				} catch(std::exception const& e) {
					pThis->callbackError = e.what();
					return 0;
				}
				return bytes;
			}
		};

		HttpContext ctx;
		ctx.userCallback = callback;

		curl_easy_reset(curl);

		// some servers require a user-agent field
		curl_easy_setopt(curl, CURLOPT_USERAGENT, "libcurl-agent/1.0");

		curl_easy_setopt(curl, CURLOPT_URL, url);
		curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &HttpContext::curlCallback);
		curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
		curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

		auto res = curl_easy_perform(curl);
		if(!ctx.callbackError.empty())
			throw std::runtime_error(ctx.callbackError);
		if(res == CURLE_HTTP_RETURNED_ERROR) {
			long status = 0;
			curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
			throw std::runtime_error(format("HTTP error %s for url '%s'", status, url));
		}
		if(res != CURLE_OK)
			throw std::runtime_error(std::string("HTTP download failed: ") + curl_easy_strerror(res));
	}

	CURL* const curl;
};

}

std::unique_ptr<Captioner::IFilePuller> createHttpSource() {
	return std::make_unique<HttpSource>();
}

}
