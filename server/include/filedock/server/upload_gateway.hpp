#pragma once

#include "filedock/server/http.hpp"
#include "filedock/server/upload_engine.hpp"

namespace filedock::server
{

    // Front door of the upload prefix: every method is handed to the engine. A request the engine
    // does not answer becomes 404, and an engine failure becomes 500 with the failure message.
    class UploadGateway
    {
    public:
        explicit UploadGateway(UploadEngine &engine);

        HttpResponse handle(const HttpRequest &request) const;

    private:
        UploadEngine &engine_;
    };

} // namespace filedock::server
