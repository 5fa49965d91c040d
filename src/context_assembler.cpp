#include "context_assembler.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>

namespace engram {

ContextOptions ContextOptions::from_config(const ContextConfig& config) {
    ContextOptions opts;
    opts.max_reflections = config.max_reflections;
    opts.max_similar = config.max_similar;
    opts.similarity_threshold = config.similarity_threshold;
    return opts;
}

ContextAssembler::ContextAssembler(MemoryStore& store, Embedder* embedder,
                                   ContextOptions options)
    : store_(store), embedder_(embedder), options_(options) {}

PersonalizationBundle ContextAssembler::assemble(const std::string& user_id) {
    PersonalizationBundle bundle;
    for (auto& r : store_.recent_reflections(user_id, options_.max_reflections)) {
        bundle.recent_reflections.push_back(std::move(r.insight_text));
    }
    bundle.intervention_count = store_.count(user_id);
    return bundle;
}

PersonalizationBundle ContextAssembler::assemble(const std::string& user_id,
                                                 const std::string& current_message,
                                                 Deadline deadline) {
    PersonalizationBundle bundle = assemble(user_id);
    if (trim(current_message).empty()) return bundle;
    bundle.similar_successes = similar_successes(user_id, current_message, deadline);
    return bundle;
}

std::vector<SimilarSuccess> ContextAssembler::similar_successes(
    const std::string& user_id, const std::string& message, Deadline deadline) {
    std::vector<SimilarSuccess> results;
    if (!embedder_ || options_.max_similar == 0) return results;

    Embedding query;
    try {
        query = embedder_->embed(message, deadline);
    } catch (const EmbeddingError& e) {
        std::cerr << "[context] Embedding failed for " << user_id << ": " << e.what() << "\n";
        return results;
    } catch (const DeadlineExceededError& e) {
        std::cerr << "[context] Embedding timed out for " << user_id << ": " << e.what() << "\n";
        return results;
    }
    if (query.size() != store_.dimensions()) {
        std::cerr << "[context] Embedder returned " << query.size()
                  << " dimensions, store expects " << store_.dimensions() << "\n";
        return results;
    }
    if (!std::all_of(query.begin(), query.end(), [](float x) { return std::isfinite(x); })) {
        std::cerr << "[context] Embedder returned non-finite values for " << user_id << "\n";
        return results;
    }

    auto hits = store_.query(user_id, query, options_.max_similar, successful_outcomes());
    for (auto& hit : hits) {
        if (hit.similarity < options_.similarity_threshold) continue;
        SimilarSuccess s;
        s.intervention_text = std::move(hit.record.intervention_text);
        s.context_text = std::move(hit.record.context_text);
        s.task_label = std::move(hit.record.task_label);
        s.outcome = hit.record.outcome;
        s.similarity = hit.similarity;
        results.push_back(std::move(s));
    }
    return results;
}

std::string render_bundle(const PersonalizationBundle& bundle) {
    std::vector<std::string> parts;

    if (!bundle.recent_reflections.empty()) {
        std::string part = "## Key insights from past sessions:";
        for (const auto& r : bundle.recent_reflections) part += "\n- " + r;
        parts.push_back(std::move(part));
    }

    if (!bundle.similar_successes.empty()) {
        std::string part = "## What worked in similar situations:";
        for (const auto& s : bundle.similar_successes) {
            char sim[16];
            std::snprintf(sim, sizeof(sim), "%.2f", s.similarity);
            part += "\n- " + s.intervention_text;
            if (!s.context_text.empty()) part += " (context: " + s.context_text + ")";
            part += " [" + outcome_to_string(s.outcome) + ", similarity " + sim + "]";
        }
        parts.push_back(std::move(part));
    }

    if (bundle.intervention_count > 0) {
        parts.push_back("## Memory status:\n- " + std::to_string(bundle.intervention_count) +
                        " past interventions stored");
    }

    if (parts.empty()) return "New user - no history yet.";

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += "\n\n";
        out += parts[i];
    }
    return out;
}

} // namespace engram
