#include "executor/Worker.hpp"
#include "protocol/FrameIO.hpp"
#include "protocol/Message.hpp"
#include "diff/Engine.hpp"
#include "util/fsPath.hpp"
#include "util/text.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>

using namespace md::executor;
using namespace md::types;
using namespace md::protocol;
using namespace md::logging;

namespace fs = std::filesystem;

namespace {

bool fileExists(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

}

ComparisonResult Worker::compare(const ComparisonRequest& request) {
    const auto resolved = request.resolvedTargetPath();
    const bool baseExists = request.preloadedReferenceContent.has_value() || fileExists(request.referencePath);
    const bool compareExists = fileExists(resolved);

    // Without a reference only the target's existence is reported.
    if (!baseExists)
        return compareExists ? ComparisonResult::identical(request.targetLabel, resolved, request.targetRootPath)
                             : ComparisonResult::missing(request.targetLabel, resolved, request.targetRootPath);

    if (!compareExists) return ComparisonResult::missing(request.targetLabel, resolved, request.targetRootPath);

    const auto baseText = request.preloadedReferenceContent
                              ? *request.preloadedReferenceContent
                              : util::sanitizeUtf8(util::readFile(request.referencePath));
    const auto compareText = util::sanitizeUtf8(util::readFile(resolved));

    if (baseText == compareText) return ComparisonResult::identical(request.targetLabel, resolved, request.targetRootPath);

    const auto counts = diff::computeCounts(baseText, compareText, request.whitespaceInsensitive);
    LogRegistry::worker()->debug("[Worker] {} vs {}: +{} -{}", request.referencePath.string(), resolved.string(),
                                 counts.added, counts.removed);
    return {request.targetLabel, counts, resolved, true, request.targetRootPath};
}

int Worker::serve(const int inFd, const int outFd) {
    while (true) {
        CompareMessage msg;
        try {
            msg = decodeRequest(FrameIO::recv_json(inFd));
        } catch (const ProtocolError& e) {
            if (e.eof()) return 0;
            // The stream cannot be resynchronised after a bad frame.
            LogRegistry::worker()->error("[Worker] Protocol error, exiting: {}", e.what());
            return 1;
        }

        nlohmann::json response;
        try {
            response = encode(ResultMessage{msg.id, compare(msg.request)});
        } catch (const std::exception& e) {
            LogRegistry::worker()->warn("[Worker] Comparison {} failed: {}", msg.id, e.what());
            response = encode(ErrorMessage{msg.id, e.what()});
        }

        try {
            FrameIO::send_json(outFd, response);
        } catch (const ProtocolError& e) {
            LogRegistry::worker()->error("[Worker] Failed to send response {}: {}", msg.id, e.what());
            return 1;
        }
    }
}
