#include "keystroke_analytics/digraph_profiler.hpp"

#include <algorithm>
#include <unordered_map>

#include "keystroke_analytics/statistics.hpp"

namespace ks::analytics {

std::vector<DigraphSamples> collectDigraphs(const EventLog& events) {
    std::vector<DigraphSamples> samples;
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 1; i < events.size(); ++i) {
        const auto& prev = events[i - 1];
        const auto& curr = events[i];
        std::string digraph = prev.key + curr.key;
        auto [it, inserted] = index.emplace(digraph, samples.size());
        if (inserted) {
            samples.push_back({std::move(digraph), {}});
        }
        samples[it->second].transitions.push_back(curr.press_time - prev.release_time);
    }
    return samples;
}

DigraphProfile profileDigraphs(const EventLog& events,
                               std::size_t min_occurrences,
                               std::size_t list_size) {
    DigraphProfile profile;
    const auto samples = collectDigraphs(events);
    profile.distinct_digraphs = samples.size();

    double fastest_time = 0.0;
    double slowest_time = 0.0;
    std::vector<DigraphTiming> eligible;
    for (const auto& sample : samples) {
        const double avg = *stats::mean(sample.transitions);
        if (!profile.fastest || avg < fastest_time) {
            profile.fastest = sample.digraph;
            fastest_time = avg;
        }
        if (!profile.slowest || avg > slowest_time) {
            profile.slowest = sample.digraph;
            slowest_time = avg;
        }
        if (sample.transitions.size() >= min_occurrences) {
            eligible.push_back({sample.digraph,
                                static_cast<int>(stats::roundHalfUp(avg)),
                                sample.transitions.size()});
        }
    }

    if (list_size == 0 || eligible.size() < list_size) {
        return profile;
    }

    std::stable_sort(eligible.begin(), eligible.end(),
                     [](const DigraphTiming& a, const DigraphTiming& b) {
                         return a.avg_time_ms < b.avg_time_ms;
                     });

    profile.top = std::vector<DigraphTiming>(eligible.begin(),
                                             eligible.begin() + static_cast<std::ptrdiff_t>(list_size));
    profile.bottom = std::vector<DigraphTiming>(eligible.rbegin(),
                                                eligible.rbegin() + static_cast<std::ptrdiff_t>(list_size));
    return profile;
}

}  // namespace ks::analytics
