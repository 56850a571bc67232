#pragma once

#include <string>
#include <string_view>

#include "timepuff/conversion_counter.h"
#include "timepuff/conversion_service.h"
#include "timepuff/status.h"

namespace timepuff {
    struct HttpRequest {
        std::string method;
        std::string target;
    };

    struct HttpResponse {
        int status;
        std::string contentType;
        std::string body;
    };

    // Maps request targets onto ConversionService calls and renders the
    // result. /api/v1/... answers in JSON, /curl/v1/... in plain text.
    class Gateway {
    public:
        explicit Gateway(ConversionService &service, const ConversionCounter *counter = nullptr);

        HttpResponse Handle(const HttpRequest &request) const;

        // plusAsSpace applies to query strings only.
        static StatusCode PercentDecode(std::string_view text, bool plusAsSpace, std::string &outDecoded);

        static int HttpStatusFor(StatusCode status) noexcept;

    private:
        ConversionService &m_Service;
        const ConversionCounter *m_Counter;

        HttpResponse Dispatch(const HttpRequest &request) const;
    };
}
