#include "filedock/server/upload_gateway.hpp"

#include <spdlog/spdlog.h>

#include "response_common.hpp"

namespace filedock::server
{

    UploadGateway::UploadGateway(UploadEngine &engine) : engine_(engine) {}

    HttpResponse UploadGateway::handle(const HttpRequest &request) const
    {
        const std::string method(request.method_string().data(), request.method_string().size());
        const std::string target(request.target().data(), request.target().size());
        spdlog::info("Upload request: {} {}", method, target);

        try
        {
            HttpResponse response{http::status::ok, request.version()};
            if (!engine_.handle(request, response))
            {
                spdlog::warn("Upload engine did not handle {} {}, sending 404", method, target);
                return response_common::make_error_response(http::status::not_found, "Not found", request);
            }
            return response;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Upload engine error on {} {}: {}", method, target, ex.what());
            return response_common::make_error_response(http::status::internal_server_error, "Internal server error",
                                                        request, std::string(ex.what()));
        }
    }

} // namespace filedock::server
