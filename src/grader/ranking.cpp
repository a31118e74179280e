#include "grader/ranking.hpp"
#include <algorithm>
#include <tuple>

namespace grader {
using namespace std;
using namespace nlohmann;

bool ranks_before(const analysis_record &a, const analysis_record &b) {
    if (a.composite != b.composite) return a.composite > b.composite;
    return tie(a.submitted_at, a.candidate_id, a.solution_id) < tie(b.submitted_at, b.candidate_id, b.solution_id);
}

vector<ranking_entry> rank_records(vector<analysis_record> records) {
    sort(records.begin(), records.end(), ranks_before);

    vector<ranking_entry> rankings;
    for (auto &record : records) {
        ranking_entry entry;
        entry.rank = rankings.size() + 1;
        entry.solution_id = record.solution_id;
        entry.candidate_id = record.candidate_id;
        entry.submitted_at = record.submitted_at;
        entry.composite = record.composite;
        entry.scores = record.scores;
        entry.ai_probability = record.ai_probability;
        entry.mcq_score = record.mcq_score;
        rankings.push_back(move(entry));
    }
    return rankings;
}

void to_json(json &j, const ranking_entry &value) {
    j = {{"rank", value.rank},
         {"solution_id", value.solution_id},
         {"candidate_id", value.candidate_id},
         {"submitted_at", value.submitted_at},
         {"composite", value.composite},
         {"scores", value.scores},
         {"ai_probability", value.ai_probability ? json(*value.ai_probability) : json()},
         {"mcq_score", value.mcq_score ? json(*value.mcq_score) : json()}};
}

}  // namespace grader
