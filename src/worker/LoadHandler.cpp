#include "cacheworker/worker/LoadHandler.h"
#include "cacheworker/common/Logger.h"
#include "cacheworker/protocol/HttpError.h"
#include "cacheworker/worker/FileSystem.h"

namespace cacheworker {
namespace worker {

using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::RequestUri;

LoadHandler::LoadHandler(LoadService& loader)
    : loader_(loader) {
}

LoadOptions LoadHandler::BuildOptions(const RequestUri& uri) {
    LoadOptions::Builder builder;

    if (auto opType = uri.getParameter("opType")) {
        auto parsed = ParseOpType(*opType);
        if (!parsed) {
            throw protocol::MalformedRequestError("Unknown opType '" + *opType + "'");
        }
        builder.setOpType(*parsed);
    }
    if (auto v = uri.getBoolParameter("partialListing")) builder.setPartialListing(*v);
    if (auto v = uri.getBoolParameter("verify")) builder.setVerify(*v);
    if (auto v = uri.getInt64Parameter("bandwidth")) {
        if (*v <= 0) {
            throw protocol::MalformedRequestError("bandwidth must be positive");
        }
        builder.setBandwidth(*v);
    }
    if (auto v = uri.getBoolParameter("verbose")) builder.setVerbose(*v);
    if (auto v = uri.getBoolParameter("loadMetadataOnly")) builder.setLoadMetadataOnly(*v);
    if (auto v = uri.getBoolParameter("skipIfExists")) builder.setSkipIfExists(*v);
    if (auto v = uri.getParameter("fileFilterRegx")) builder.setFileFilterPattern(*v);
    if (auto v = uri.getParameter("progressFormat")) {
        if (!protocol::IEquals(*v, "TEXT") && !protocol::IEquals(*v, "JSON")) {
            throw protocol::MalformedRequestError("Unknown progressFormat '" + *v + "'");
        }
        builder.setProgressFormat(*v);
    }
    return builder.Build();
}

HttpResponse LoadHandler::Handle(const HttpRequest& request, const RequestUri& uri) {
    (void)request;
    auto rawPath = uri.getParameter("path");
    if (!rawPath || rawPath->empty()) {
        throw protocol::MalformedRequestError("Missing 'path' parameter");
    }
    const std::string path = protocol::DecodeReservedCharacters(*rawPath);
    LoadOptions options = BuildOptions(uri);

    LOG_INFO << "LoadHandler: path=" << path << " " << options.ToString();
    std::string status;
    try {
        status = loader_.Load(path, options);
    } catch (const FileSystemError& e) {
        LOG_ERROR << "LoadHandler: load " << path << " failed: " << e.what();
        throw protocol::BackendIOError("Failed to load " + path + ": " + e.what());
    }
    return HttpResponse::PlainText(HttpResponse::k200Ok, status);
}

} // namespace worker
} // namespace cacheworker
