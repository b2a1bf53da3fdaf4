#include <MetadataResolver.hpp>
#include <Concurrency.hpp>
#include <Errors.hpp>
#include <Utils.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <tuple>

namespace {

struct MergedCandidate {
    std::string value;
    double confidence{};
    size_t distance{};                      // closest reported title
    std::vector<std::string> services;
    std::optional<BookDetails> book;
};

// numeric ids compare by magnitude, "tt..." ids by their digits
bool smaller_identifier(const std::string& a, const std::string& b) {
    return std::make_tuple(a.size(), a) < std::make_tuple(b.size(), b);
}

struct ServiceResult {
    std::vector<IdentifierCandidate> candidates;
    bool failed{};
};

}

IdentitySet reconcile(const std::vector<IdentifierCandidate>& candidates, double threshold,
                      const std::string& parsed_title, const std::string& query) {
    IdentitySet identities;
    auto wanted = normalize_title(parsed_title);

    for (auto kind : { IdentifierKind::Tmdb, IdentifierKind::Imdb, IdentifierKind::Tvdb, IdentifierKind::OpenLibrary }) {
        std::map<std::string, MergedCandidate> merged;

        for (const auto& c : candidates) {
            if (c.kind != kind || c.value.empty() || c.confidence < threshold) continue;

            auto distance = edit_distance(normalize_title(c.title), wanted);
            auto [it, inserted] = merged.try_emplace(c.value);
            auto& m = it->second;

            if (inserted) {
                m.value = c.value;
                m.confidence = c.confidence;
                m.distance = distance;
            } else {
                m.confidence = std::max(m.confidence, c.confidence);
                m.distance = std::min(m.distance, distance);
            }
            if (std::find(m.services.begin(), m.services.end(), c.service) == m.services.end()) m.services.push_back(c.service);
            if (!m.book && c.book) m.book = c.book;
        }

        if (merged.empty()) continue;

        auto best = std::min_element(merged.begin(), merged.end(), [](const auto& lhs, const auto& rhs) {
            const auto& a = lhs.second;
            const auto& b = rhs.second;
            if (a.distance != b.distance) return a.distance < b.distance;
            if (a.confidence != b.confidence) return a.confidence > b.confidence;
            return smaller_identifier(a.value, b.value);
        });

        auto& chosen = best->second;
        std::sort(chosen.services.begin(), chosen.services.end());

        identities.slot(kind) = ResolvedIdentifier{ chosen.value, chosen.confidence, query, chosen.services, merged.size() > 1 };
        if (kind == IdentifierKind::OpenLibrary) identities.book = chosen.book;
    }

    return identities;
}

IdentitySet MetadataResolver::resolve(const Release& release, ContentType type, const ParsedName& parsed) const {
    if (type == ContentType::MusicAlbum || type == ContentType::Other) {
        SEEDTOOLS_LOG(log_, debug) << release.name << ": " << content_type_name(type) << " is not resolved";
        return {};
    }

    auto query = make_query(type, parsed);

    std::vector<std::shared_ptr<IdentificationService>> consulted;
    for (const auto& s : services_) {
        if (s->supports(type)) consulted.push_back(s);
    }

    if (consulted.empty()) {
        SEEDTOOLS_LOG(log_, warning) << "No identification service configured for " << content_type_name(type);
        return {};
    }

    SEEDTOOLS_LOG(log_, info) << "Resolving " << query.describe() << " against " << consulted.size() << " service(s)";

    auto results = fan_out(consulted.size(), policy_.max_concurrency, [&](size_t i) {
        const auto& service = consulted[i];
        try {
            return ServiceResult{ service->search(query), false };
        } catch (const TransientNetworkError& e) {
            SEEDTOOLS_LOG(log_, warning) << service->name() << " unreachable: " << e.what();
        } catch (const ServiceError& e) {
            SEEDTOOLS_LOG(log_, warning) << service->name() << " failed: " << e.what();
        }
        return ServiceResult{ {}, true };
    });

    std::vector<IdentifierCandidate> candidates;
    size_t failures = 0;
    for (auto& r : results) {
        if (r.failed) ++failures;
        candidates.insert(candidates.end(), std::make_move_iterator(r.candidates.begin()), std::make_move_iterator(r.candidates.end()));
    }

    if (failures == consulted.size()) {
        if (is_video(type)) throw ResolutionError("every identification service failed for " + query.describe());
        SEEDTOOLS_LOG(log_, warning) << "Bibliographic lookup failed, continuing without identifiers";
        return {};
    }

    auto identities = reconcile(candidates, policy_.acceptance_threshold, query.title, query.describe());

    for (auto kind : { IdentifierKind::Tmdb, IdentifierKind::Imdb, IdentifierKind::Tvdb, IdentifierKind::OpenLibrary }) {
        const auto& id = identities.slot(kind);
        if (!id) continue;
        SEEDTOOLS_LOG(log_, info) << identifier_kind_name(kind) << ": " << id->value << " (confidence " << id->confidence
                                  << (id->ambiguous ? ", ambiguous" : "") << ")";
    }

    return identities;
}
