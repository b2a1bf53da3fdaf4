#include <TrackerFactory.hpp>
#include <TorrentLeechTracker.hpp>
#include <Unit3dTracker.hpp>
#include <Errors.hpp>

std::unique_ptr<BaseTracker> make_tracker(const TrackerTarget& target, HttpTransport& transport,
                                          const Policy& policy, Logger& log) {
    switch (target.kind) {
    case TrackerKind::Unit3d: return std::make_unique<Unit3dTracker>(target, transport, policy, log);
    case TrackerKind::TorrentLeech: return std::make_unique<TorrentLeechTracker>(target, transport, policy, log);
    }
    throw ConfigError("unsupported tracker kind for '" + target.name + "'");
}
