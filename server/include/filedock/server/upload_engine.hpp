#pragma once

#include "filedock/server/http.hpp"

namespace filedock::server
{

    // Resumable-upload protocol engine. Implementations own the wire protocol and persist every
    // artifact in the upload directory they were configured with.
    class UploadEngine
    {
    public:
        virtual ~UploadEngine() = default;

        // Returns false when the request is not an operation the engine recognises; the response
        // is left untouched in that case.
        virtual bool handle(const HttpRequest &request, HttpResponse &response) = 0;
    };

} // namespace filedock::server
