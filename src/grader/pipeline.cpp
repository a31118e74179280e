#include "grader/pipeline.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include <set>
#include "analyzer/correctness.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

double score_mcq(const mcq_question &question, const mcq_answer *answer) {
    if (!answer) return 0;
    set<string> correct(question.correct_answers.begin(), question.correct_answers.end());
    set<string> chosen(answer->selected.begin(), answer->selected.end());
    if (chosen == correct) return 1;
    if (correct.empty()) return 0;
    size_t hits = count_if(chosen.begin(), chosen.end(), [&](auto &option) { return correct.count(option) > 0; });
    return (double)hits / correct.size();
}

analysis_pipeline::analysis_pipeline(repository &repo, sandbox_runner &runner, const grader_config &config)
    : analysis_pipeline(repo, make_unique<correctness_analyzer>(runner), make_static_analyzers(), config) {}

analysis_pipeline::analysis_pipeline(repository &repo, unique_ptr<analyzer> correctness,
                                     vector<unique_ptr<analyzer>> analyzers, const grader_config &config)
    : repo(repo),
      correctness(move(correctness)),
      analyzers(move(analyzers)),
      weights(config.weights),
      fail_on_total_timeout(config.orchestrator.fail_on_total_timeout) {}

/**
 * @brief 运行一个分析器，分析器抛出的异常转换为空分数
 */
static analyzer_result run_analyzer(const analyzer &target, const analysis_context &context) {
    analyzer_result result;
    try {
        result = target.analyze(context);
    } catch (std::exception &ex) {
        LOG(WARNING) << get_kind_name(error_kind::ANALYZER_FAILURE) << ": " << get_dimension_name(target.type())
                     << " analyzer failed on solution " << context.submission.solution_id << " question "
                     << context.question.question_id << ": " << ex.what();
        result = analyzer_result();
        result.reason = fmt::format("{}: {}", get_kind_name(error_kind::ANALYZER_FAILURE), ex.what());
    }
    result.type = target.type();

    if (result.score && !isfinite(*result.score)) {
        result.score.reset();
        result.reason = fmt::format("{}: score is not a finite number", get_kind_name(error_kind::ANALYZER_FAILURE));
    }
    if (result.score) result.score = clamp(*result.score, 0.0, 1.0);
    return result;
}

static void merge_result(question_analysis &analysis, analyzer_result &result) {
    if (result.type == dimension::AI_DETECTION)
        analysis.ai_probability = result.score;
    else
        analysis.scores[result.type] = result.score;
    if (!result.reason.empty()) analysis.reasons[result.type] = result.reason;
    analysis.details[result.type] = move(result.details);
}

question_analysis analysis_pipeline::analyze_question(const solution &submission, const coding_question &question,
                                                      const coding_answer &answer) {
    question_analysis analysis;
    analysis.question_id = question.question_id;
    analysis.language = answer.language;
    for (dimension dim : COMPOSITE_DIMENSIONS) analysis.scores[dim] = nullopt;

    language lang;
    try {
        lang = parse_language(answer.language);
    } catch (invalid_argument_error &ex) {
        LOG(WARNING) << "Solution " << submission.solution_id << " question " << question.question_id << ": " << ex.what();
        for (dimension dim : COMPOSITE_DIMENSIONS)
            analysis.reasons[dim] = fmt::format("{}: {}", get_kind_name(ex.kind()), ex.what());
        return analysis;
    }
    analysis.language = get_language_name(lang);
    const language_harness &harness = get_harness(lang);

    vector<execution_result> executions;
    if (correctness) {
        analysis_context context{submission, question, answer, harness, executions};
        analyzer_result result = run_analyzer(*correctness, context);
        executions = move(result.executions);
        merge_result(analysis, result);
    } else {
        analysis.reasons[dimension::CORRECTNESS] = "Correctness analysis is disabled";
    }

    // 执行结果先于分析记录保存
    repo.save_executions(submission.solution_id, question.question_id, executions);

    bool all_timed_out = !executions.empty() && all_of(executions.begin(), executions.end(), [](auto &e) {
        return e.result == status::TIME_LIMIT_EXCEEDED;
    });
    if (all_timed_out && fail_on_total_timeout)
        throw execution_timeout(fmt::format("All {} test cases of question {} timed out", executions.size(),
                                            question.question_id));

    analysis_context context{submission, question, answer, harness, executions};
    for (auto &static_analyzer : analyzers) {
        analyzer_result result = run_analyzer(*static_analyzer, context);
        merge_result(analysis, result);
    }
    analysis.composite = compute_composite(analysis.scores, weights);
    return analysis;
}

analysis_record analysis_pipeline::run(const solution &submission) {
    auto test = repo.find_assessment(submission.test_id);
    if (!test) throw not_found_error(fmt::format("Test {} not found", submission.test_id));
    return run(submission, *test);
}

analysis_record analysis_pipeline::run(const solution &submission, const assessment &test) {
    LOG(INFO) << "Analyzing solution " << submission.solution_id << " of test " << test.test_id;

    analysis_record record;
    record.solution_id = submission.solution_id;
    record.test_id = submission.test_id;
    record.candidate_id = submission.candidate_id;
    record.submitted_at = submission.submitted_at;

    for (auto &question : test.coding_questions) {
        auto answer = find_if(submission.coding_answers.begin(), submission.coding_answers.end(),
                              [&](auto &a) { return a.question_id == question.question_id; });
        if (answer == submission.coding_answers.end()) {
            // 未作答的编程题正确性记为 0，其他维度无法分析
            question_analysis analysis;
            analysis.question_id = question.question_id;
            for (dimension dim : COMPOSITE_DIMENSIONS) analysis.scores[dim] = nullopt;
            analysis.scores[dimension::CORRECTNESS] = 0.0;
            analysis.reasons[dimension::CORRECTNESS] = "Question not answered";
            analysis.composite = compute_composite(analysis.scores, weights);
            record.questions.push_back(move(analysis));
            continue;
        }
        record.questions.push_back(analyze_question(submission, question, *answer));
    }
    for (auto &answer : submission.coding_answers) {
        bool known = any_of(test.coding_questions.begin(), test.coding_questions.end(),
                            [&](auto &q) { return q.question_id == answer.question_id; });
        if (!known)
            LOG(WARNING) << "Solution " << submission.solution_id << " answers unknown question " << answer.question_id;
    }

    // 各维度在所有编程题上取平均，忽略为空的维度
    double ai_total = 0;
    size_t ai_count = 0;
    for (dimension dim : COMPOSITE_DIMENSIONS) {
        double total = 0;
        size_t count = 0;
        for (auto &question : record.questions) {
            auto it = question.scores.find(dim);
            if (it != question.scores.end() && it->second) {
                total += *it->second;
                ++count;
            }
        }
        record.scores[dim] = count ? optional<double>(total / count) : nullopt;
    }
    for (auto &question : record.questions) {
        if (question.ai_probability) {
            ai_total += *question.ai_probability;
            ++ai_count;
        }
    }
    if (ai_count) record.ai_probability = ai_total / ai_count;
    if (!record.questions.empty()) record.coding_score = compute_composite(record.scores, weights);

    if (!test.mcq_questions.empty()) {
        double total = 0;
        for (auto &question : test.mcq_questions) {
            auto answer = find_if(submission.mcq_answers.begin(), submission.mcq_answers.end(),
                                  [&](auto &a) { return a.question_id == question.question_id; });
            total += score_mcq(question, answer == submission.mcq_answers.end() ? nullptr : &*answer);
        }
        record.mcq_score = total / test.mcq_questions.size();
    }

    // 按存在的题型归一化
    double total = 0, weight_sum = 0;
    if (record.coding_score) {
        total += weights.coding * *record.coding_score;
        weight_sum += weights.coding;
    }
    if (record.mcq_score) {
        total += weights.mcq * *record.mcq_score;
        weight_sum += weights.mcq;
    }
    record.composite = weight_sum > 0 ? clamp(total / weight_sum, 0.0, 1.0) : 0.0;
    record.analyzed_at = current_timestamp();

    repo.save_analysis(record);
    LOG(INFO) << "Solution " << submission.solution_id << " analyzed, composite score " << record.composite;
    return record;
}

}  // namespace grader
