#include "storage/repository.hpp"

namespace grader {
using namespace std;

template <typename MapT>
static optional<typename MapT::mapped_type> find_value(const MapT &values, const string &key) {
    auto it = values.find(key);
    if (it == values.end()) return nullopt;
    return it->second;
}

void memory_repository::save_assessment(const assessment &test) {
    scoped_lock lock(mut);
    assessments[test.test_id] = test;
}

optional<assessment> memory_repository::find_assessment(const string &test_id) const {
    scoped_lock lock(mut);
    return find_value(assessments, test_id);
}

vector<string> memory_repository::list_assessment_ids() const {
    scoped_lock lock(mut);
    vector<string> ids;
    for (auto &[test_id, test] : assessments) ids.push_back(test_id);
    return ids;
}

void memory_repository::save_solution(const solution &submission) {
    scoped_lock lock(mut);
    solutions[submission.solution_id] = submission;
}

optional<solution> memory_repository::find_solution(const string &solution_id) const {
    scoped_lock lock(mut);
    return find_value(solutions, solution_id);
}

vector<solution> memory_repository::find_solutions_by_test(const string &test_id) const {
    scoped_lock lock(mut);
    vector<solution> result;
    for (auto &[solution_id, submission] : solutions)
        if (submission.test_id == test_id) result.push_back(submission);
    return result;
}

vector<solution> memory_repository::find_unanalyzed_solutions() const {
    scoped_lock lock(mut);
    vector<solution> result;
    for (auto &[solution_id, submission] : solutions)
        if (!analyses.count(solution_id)) result.push_back(submission);
    return result;
}

void memory_repository::save_executions(const string &solution_id, const string &question_id,
                                        const vector<execution_result> &results) {
    scoped_lock lock(mut);
    executions[solution_id][question_id] = results;
}

vector<execution_result> memory_repository::find_executions(const string &solution_id) const {
    scoped_lock lock(mut);
    vector<execution_result> result;
    auto it = executions.find(solution_id);
    if (it == executions.end()) return result;
    for (auto &[question_id, results] : it->second)
        result.insert(result.end(), results.begin(), results.end());
    return result;
}

void memory_repository::save_analysis(const analysis_record &record) {
    scoped_lock lock(mut);
    analyses[record.solution_id] = record;
}

optional<analysis_record> memory_repository::find_analysis(const string &solution_id) const {
    scoped_lock lock(mut);
    return find_value(analyses, solution_id);
}

vector<analysis_record> memory_repository::find_analyses_by_test(const string &test_id) const {
    scoped_lock lock(mut);
    vector<analysis_record> result;
    for (auto &[solution_id, record] : analyses)
        if (record.test_id == test_id) result.push_back(record);
    return result;
}

void memory_repository::save_job(const job &value) {
    scoped_lock lock(mut);
    jobs[value.job_id] = value;
}

optional<job> memory_repository::find_job(const string &job_id) const {
    scoped_lock lock(mut);
    return find_value(jobs, job_id);
}

void memory_repository::save_report(const test_report &report) {
    scoped_lock lock(mut);
    reports[report.test_id] = report;
}

optional<test_report> memory_repository::find_report(const string &test_id) const {
    scoped_lock lock(mut);
    return find_value(reports, test_id);
}

}  // namespace grader
