#include "reflection.hpp"
#include "context_assembler.hpp"
#include "memory_store.hpp"
#include "text_generator.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace engram {

ReflectionOptions ReflectionOptions::from_config(const ReflectionConfig& config) {
    ReflectionOptions opts;
    opts.max_turns = config.max_turns;
    opts.min_turns = config.min_turns;
    opts.summary_max_chars = config.summary_max_chars;
    return opts;
}

static bool is_substantive(const Turn& turn) {
    return !trim(turn.content).empty();
}

uint32_t count_substantive_turns(const Transcript& transcript) {
    return static_cast<uint32_t>(
        std::count_if(transcript.begin(), transcript.end(), is_substantive));
}

std::string format_transcript(const Transcript& transcript, uint32_t max_turns) {
    std::vector<const Turn*> kept;
    for (auto it = transcript.rbegin(); it != transcript.rend() && kept.size() < max_turns; ++it) {
        if (is_substantive(*it)) kept.push_back(&*it);
    }
    std::reverse(kept.begin(), kept.end());

    std::string out;
    for (const Turn* turn : kept) {
        std::string role = turn->role.empty() ? "unknown" : turn->role;
        std::transform(role.begin(), role.end(), role.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (!out.empty()) out += '\n';
        out += role + ": " + trim(turn->content);
    }
    return out;
}

std::string build_reflection_prompt(const std::string& formatted_transcript,
                                    const std::vector<std::string>& prior_insights) {
    std::string previous;
    for (const auto& insight : prior_insights) {
        if (!previous.empty()) previous += '\n';
        previous += "- " + insight;
    }
    if (previous.empty()) previous = "None yet";

    return "Analyze this support session.\n\n"
           "SESSION TRANSCRIPT:\n" + formatted_transcript + "\n\n"
           "PREVIOUS INSIGHTS ABOUT THIS USER:\n" + previous + "\n\n"
           "Generate ONE brief insight (1-2 sentences) about what we learned from this session.\n"
           "Focus on:\n"
           "- What intervention styles worked or didn't work\n"
           "- User's preferences or patterns you noticed\n"
           "- What to do differently next time\n\n"
           "Keep it specific and actionable.";
}

ReflectionSynthesizer::ReflectionSynthesizer(MemoryStore& store, ContextAssembler& assembler,
                                             ReflectionOptions options)
    : store_(store), assembler_(assembler), options_(options) {}

std::optional<Reflection> ReflectionSynthesizer::synthesize(const std::string& user_id,
                                                            const Transcript& transcript,
                                                            TextGenerator& generator,
                                                            Deadline deadline) {
    uint32_t turns = count_substantive_turns(transcript);
    if (turns < std::max<uint32_t>(options_.min_turns, 1)) {
        std::cerr << "[reflection] Skipping " << user_id << ": only " << turns
                  << " substantive turns\n";
        return std::nullopt;
    }

    std::string formatted = format_transcript(transcript, options_.max_turns);

    std::vector<std::string> prior;
    try {
        prior = assembler_.assemble(user_id).recent_reflections;
    } catch (const std::exception& e) {
        std::cerr << "[reflection] Prior insights unavailable: " << e.what() << "\n";
    }

    std::string insight;
    try {
        insight = trim(generator.generate(build_reflection_prompt(formatted, prior), deadline));
    } catch (const GenerationError& e) {
        std::cerr << "[reflection] Generation failed for " << user_id << ": " << e.what() << "\n";
        return std::nullopt;
    } catch (const DeadlineExceededError& e) {
        std::cerr << "[reflection] Generation timed out for " << user_id << ": " << e.what() << "\n";
        return std::nullopt;
    }
    if (insight.empty()) {
        std::cerr << "[reflection] Generator returned an empty insight for " << user_id << "\n";
        return std::nullopt;
    }

    Reflection record;
    record.user_id = user_id;
    record.insight_text = insight;
    record.session_summary = truncate_utf8(formatted, options_.summary_max_chars);
    record.created_at = store_.clock().now_millis();
    record.ttl = store_.options().retention.reflection_ttl_ms;

    try {
        record.id = store_.put(record);
    } catch (const StoreUnavailableError& e) {
        std::cerr << "[reflection] Dropping reflection for " << user_id
                  << ", store unavailable: " << e.what() << "\n";
        return std::nullopt;
    }
    return record;
}

} // namespace engram
