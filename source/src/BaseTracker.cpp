#include <BaseTracker.hpp>
#include <Errors.hpp>

#include <nlohmann/json.hpp>

HttpResponse BaseTracker::exchange(const HttpRequest& request, const std::string& what, bool retry) {
    try {
        if (!retry) return transport_.send(request);

        return with_retry(policy_.retry, log_, name() + " " + what, [&] {
            auto response = transport_.send(request);
            if (is_transient_status(response.status))
                throw TransientNetworkError(what + " returned HTTP " + std::to_string(response.status), response.status);
            return response;
        });
    } catch (const TransientNetworkError& e) {
        throw TargetError(name(), what + ": " + e.what(), e.status());
    }
}

void BaseTracker::fail(const HttpResponse& response, const std::string& what) const {
    std::string message = trim(response.body);

    // UNIT3D answers errors with {"message": ...} or {"data": {...}}
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("message") && parsed["message"].is_string()) message = parsed["message"].get<std::string>();
        else if (parsed.contains("data")) message = parsed["data"].dump();
    }

    if (message.size() > 300) message = message.substr(0, 300) + "...";
    throw TargetError(name(), what + " returned HTTP " + std::to_string(response.status) + (message.empty() ? "" : ": " + message),
                      response.status);
}

std::string imdb_digits(const std::string& imdb) {
    if (imdb.size() > 2 && (imdb.rfind("tt", 0) == 0)) return imdb.substr(2);
    return imdb;
}
