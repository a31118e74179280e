#include "grader/orchestrator.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/utils.hpp"
#include "grader/ranking.hpp"

namespace grader {
using namespace std;

job_orchestrator::job_orchestrator(repository &repo, const grader_config &config)
    : job_orchestrator(repo, config, resolve_strategy(config.sandbox)) {}

job_orchestrator::job_orchestrator(repository &repo, const grader_config &config, shared_ptr<sandbox_strategy> strategy)
    : repo(repo),
      options(config.orchestrator),
      strategy_(move(strategy)),
      runner(strategy_, config.sandbox),
      pipeline(repo, runner, config),
      workers(config.orchestrator.workers) {
    LOG(INFO) << "Job orchestrator started with " << workers.size() << " workers, sandbox " << strategy_->name();
}

job_orchestrator::~job_orchestrator() {
    {
        unique_lock<mutex> lock(mut);
        cond.wait(lock, [this] {
            for (auto &[job_id, entry] : jobs)
                if (!is_terminal(entry.value.state)) return false;
            return true;
        });
    }
    workers.stop();
}

const sandbox_strategy &job_orchestrator::strategy() const {
    return *strategy_;
}

job_orchestrator::job_entry &job_orchestrator::find_entry(const string &job_id) {
    auto it = jobs.find(job_id);
    if (it == jobs.end()) throw not_found_error(fmt::format("Job {} not found", job_id));
    return it->second;
}

const job_orchestrator::job_entry &job_orchestrator::find_entry(const string &job_id) const {
    auto it = jobs.find(job_id);
    if (it == jobs.end()) throw not_found_error(fmt::format("Job {} not found", job_id));
    return it->second;
}

/**
 * @brief 追加作业日志，调用方必须持有 mut
 */
void job_orchestrator::append_log(job_entry &entry, const string &message) {
    LOG(INFO) << "Job " << entry.value.job_id << ": " << message;
    entry.value.logs.push_back({current_timestamp(), message});
}

/**
 * @brief 作业进入终止状态，调用方必须持有 mut
 */
void job_orchestrator::finish(job_entry &entry, job_status state) {
    job &value = entry.value;
    value.state = state;
    value.finished_at = current_timestamp();
    job_summary summary = value.summary();
    append_log(entry, fmt::format("Job finished with status {} ({} succeeded, {} failed)", get_status_name(state),
                                  summary.succeeded, summary.failed));
    repo.save_job(value);
    cond.notify_all();
}

string job_orchestrator::submit_job(job_scope scope, const string &target_id) {
    if (scope != job_scope::ALL && target_id.empty())
        throw invalid_argument_error(fmt::format("Job scope {} requires a target id", get_scope_name(scope)));

    string job_id = generate_uuid();
    {
        scoped_lock lock(mut);
        job_entry &entry = jobs[job_id];
        job_order.push_back(job_id);
        entry.value.job_id = job_id;
        entry.value.scope = scope;
        entry.value.target_id = scope == job_scope::ALL ? "" : target_id;
        entry.value.state = job_status::QUEUED;
        entry.value.created_at = current_timestamp();
        if (scope == job_scope::ALL)
            append_log(entry, "Job queued for all unanalyzed solutions");
        else
            append_log(entry, fmt::format("Job queued for {} {}", get_scope_name(scope), target_id));
        repo.save_job(entry.value);
    }

    workers.submit([this, job_id] { start_job(job_id); });
    return job_id;
}

void job_orchestrator::start_job(const string &job_id) {
    job_scope scope;
    string target_id;
    {
        scoped_lock lock(mut);
        job_entry &entry = find_entry(job_id);
        entry.value.state = job_status::RUNNING;
        entry.value.started_at = current_timestamp();
        append_log(entry, "Job started");
        repo.save_job(entry.value);
        scope = entry.value.scope;
        target_id = entry.value.target_id;
    }

    vector<solution> solutions;
    shared_ptr<const assessment> test;
    try {
        switch (scope) {
            case job_scope::SOLUTION: {
                auto submission = repo.find_solution(target_id);
                if (!submission) throw not_found_error(fmt::format("Solution {} not found", target_id));
                solutions.push_back(move(*submission));
                break;
            }
            case job_scope::TEST: {
                auto found = repo.find_assessment(target_id);
                if (!found) throw not_found_error(fmt::format("Test {} not found", target_id));
                test = make_shared<const assessment>(move(*found));
                solutions = repo.find_solutions_by_test(target_id);
                break;
            }
            case job_scope::ALL: solutions = repo.find_unanalyzed_solutions(); break;
        }
    } catch (grader_exception &ex) {
        scoped_lock lock(mut);
        job_entry &entry = find_entry(job_id);
        entry.value.error = ex.kind();
        entry.value.error_message = ex.what();
        append_log(entry, fmt::format("{}: {}", get_kind_name(ex.kind()), ex.what()));
        finish(entry, job_status::FAILED);
        return;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Job " << job_id << " failed to load solutions, " << boost::diagnostic_information(ex);
        scoped_lock lock(mut);
        job_entry &entry = find_entry(job_id);
        entry.value.error = error_kind::INTERNAL_ERROR;
        entry.value.error_message = ex.what();
        append_log(entry, fmt::format("{}: {}", get_kind_name(error_kind::INTERNAL_ERROR), ex.what()));
        finish(entry, job_status::FAILED);
        return;
    }

    {
        scoped_lock lock(mut);
        job_entry &entry = find_entry(job_id);
        for (auto &submission : solutions) {
            job_item item;
            item.solution_id = submission.solution_id;
            entry.value.items.push_back(move(item));
        }
        entry.remaining = solutions.size();
        if (solutions.empty()) {
            append_log(entry, "No solutions to analyze");
            finish(entry, job_status::SUCCEEDED);
            return;
        }
        append_log(entry, fmt::format("Analyzing {} solution(s)", solutions.size()));
        repo.save_job(entry.value);
    }

    for (size_t i = 0; i < solutions.size(); ++i)
        workers.submit([this, job_id, i, submission = move(solutions[i]), test] { run_item(job_id, i, submission, test); });
}

void job_orchestrator::run_item(const string &job_id, size_t index, const solution &submission,
                                const shared_ptr<const assessment> &test) {
    optional<error_kind> error;
    string error_message;
    double composite = 0;
    try {
        analysis_record record = test ? pipeline.run(submission, *test) : pipeline.run(submission);
        composite = record.composite;
    } catch (grader_exception &ex) {
        error = ex.kind();
        error_message = ex.what();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Job " << job_id << " crashed on solution " << submission.solution_id << ", "
                   << boost::diagnostic_information(ex);
        error = error_kind::INTERNAL_ERROR;
        error_message = ex.what();
    }

    scoped_lock lock(mut);
    job_entry &entry = find_entry(job_id);
    job_item &item = entry.value.items[index];
    if (error) {
        item.state = item_status::FAILED;
        item.error = error;
        item.error_message = error_message;
        LOG(WARNING) << "Job " << job_id << ": solution " << submission.solution_id << " failed";
        append_log(entry, fmt::format("Solution {} failed: {}: {}", submission.solution_id, get_kind_name(*error),
                                      error_message));
    } else {
        item.state = item_status::SUCCEEDED;
        append_log(entry, fmt::format("Solution {} analyzed, composite score {:.4f}", submission.solution_id, composite));
    }

    if (--entry.remaining > 0) {
        repo.save_job(entry.value);
        return;
    }

    // 所有提交都已结束
    job_summary summary = entry.value.summary();
    if (entry.value.scope == job_scope::SOLUTION) {
        if (summary.failed) {
            entry.value.error = entry.value.items.front().error;
            entry.value.error_message = entry.value.items.front().error_message;
        }
        finish(entry, summary.failed ? job_status::FAILED : job_status::SUCCEEDED);
    } else if (summary.failed) {
        entry.value.error = error_kind::JOB_PARTIAL_FAILURE;
        entry.value.error_message = fmt::format("{} of {} solutions failed", summary.failed, summary.total);
        finish(entry, job_status::PARTIAL);
    } else {
        finish(entry, job_status::SUCCEEDED);
    }
}

job job_orchestrator::get_job(const string &job_id) const {
    {
        scoped_lock lock(mut);
        auto it = jobs.find(job_id);
        if (it != jobs.end()) return it->second.value;
    }
    // 其他进程创建的作业
    auto persisted = repo.find_job(job_id);
    if (!persisted) throw not_found_error(fmt::format("Job {} not found", job_id));
    return *persisted;
}

vector<job_log_entry> job_orchestrator::get_job_logs(const string &job_id) const {
    return get_job(job_id).logs;
}

vector<job> job_orchestrator::list_jobs() const {
    scoped_lock lock(mut);
    vector<job> result;
    for (auto &job_id : job_order) result.push_back(jobs.at(job_id).value);
    return result;
}

job job_orchestrator::wait_for_job(const string &job_id, chrono::milliseconds timeout) const {
    unique_lock<mutex> lock(mut);
    const job_entry &entry = find_entry(job_id);
    cond.wait_for(lock, timeout, [&] { return is_terminal(entry.value.state); });
    return entry.value;
}

analysis_record job_orchestrator::get_analysis(const string &solution_id) const {
    auto record = repo.find_analysis(solution_id);
    if (!record) throw not_found_error(fmt::format("Analysis of solution {} not found", solution_id));
    return *record;
}

vector<test_report> job_orchestrator::generate_report(const string &test_id) {
    vector<test_report> reports;
    if (test_id == "all") {
        for (auto &id : repo.list_assessment_ids()) {
            auto records = repo.find_analyses_by_test(id);
            if (records.empty()) continue;
            auto test = repo.find_assessment(id);
            if (!test) continue;
            reports.push_back(build_test_report(*test, records));
        }
    } else {
        auto test = repo.find_assessment(test_id);
        if (!test) throw not_found_error(fmt::format("Test {} not found", test_id));
        reports.push_back(build_test_report(*test, repo.find_analyses_by_test(test_id)));
    }

    for (auto &report : reports) {
        repo.save_report(report);
        LOG(INFO) << "Report of test " << report.test_id << " generated with " << report.solution_count << " solutions";
    }
    return reports;
}

solution_report job_orchestrator::get_solution_report(const string &solution_id) const {
    analysis_record record = get_analysis(solution_id);
    return build_solution_report(record, rank_records(repo.find_analyses_by_test(record.test_id)));
}

}  // namespace grader
