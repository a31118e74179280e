#include "grader/models.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

const coding_question &assessment::find_coding_question(const string &question_id) const {
    for (auto &question : coding_questions)
        if (question.question_id == question_id) return question;
    throw not_found_error("Question " + question_id + " not found in test " + test_id);
}

void to_json(json &j, const test_case &value) {
    j = {{"id", value.id},
         {"input", value.input},
         {"expected_output", value.expected_output},
         {"weight", value.weight},
         {"is_hidden", value.hidden}};
}

// 测试输入和期望输出可以直接写成 json 值，此时保存其序列化文本
static string text_or_dump(const json &j) {
    return j.is_string() ? j.get<string>() : j.dump();
}

void from_json(const json &j, test_case &value) {
    if (j.count("id")) j.at("id").get_to(value.id);
    value.input = text_or_dump(j.at("input"));
    value.expected_output = text_or_dump(j.at("expected_output"));
    if (j.count("weight")) j.at("weight").get_to(value.weight);
    if (j.count("is_hidden")) j.at("is_hidden").get_to(value.hidden);
}

void to_json(json &j, const coding_question &value) {
    j = {{"question_id", value.question_id},
         {"title", value.title},
         {"description", value.description},
         {"test_cases", value.test_cases},
         {"time_complexity", value.time_complexity},
         {"space_complexity", value.space_complexity}};
    if (value.function_name) j["function_name"] = *value.function_name;
}

void from_json(const json &j, coding_question &value) {
    j.at("question_id").get_to(value.question_id);
    if (j.count("title")) j.at("title").get_to(value.title);
    if (j.count("description")) j.at("description").get_to(value.description);
    if (j.count("function_name") && !j.at("function_name").is_null())
        value.function_name = j.at("function_name").get<string>();
    if (j.count("test_cases")) j.at("test_cases").get_to(value.test_cases);
    if (j.count("time_complexity")) j.at("time_complexity").get_to(value.time_complexity);
    if (j.count("space_complexity")) j.at("space_complexity").get_to(value.space_complexity);
}

void to_json(json &j, const mcq_question &value) {
    j = {{"question_id", value.question_id}, {"correct_answers", value.correct_answers}};
}

void from_json(const json &j, mcq_question &value) {
    j.at("question_id").get_to(value.question_id);
    j.at("correct_answers").get_to(value.correct_answers);
}

void to_json(json &j, const assessment &value) {
    j = {{"test_id", value.test_id},
         {"title", value.title},
         {"coding_questions", value.coding_questions},
         {"mcq_questions", value.mcq_questions}};
}

void from_json(const json &j, assessment &value) {
    j.at("test_id").get_to(value.test_id);
    if (j.count("title")) j.at("title").get_to(value.title);
    if (j.count("coding_questions")) j.at("coding_questions").get_to(value.coding_questions);
    if (j.count("mcq_questions")) j.at("mcq_questions").get_to(value.mcq_questions);
}

void to_json(json &j, const coding_answer &value) {
    j = {{"question_id", value.question_id},
         {"language", value.language},
         {"code", value.code},
         {"submitted_at", value.submitted_at}};
}

void from_json(const json &j, coding_answer &value) {
    j.at("question_id").get_to(value.question_id);
    j.at("language").get_to(value.language);
    j.at("code").get_to(value.code);
    if (j.count("submitted_at")) j.at("submitted_at").get_to(value.submitted_at);
}

void to_json(json &j, const mcq_answer &value) {
    j = {{"question_id", value.question_id}, {"selected", value.selected}};
}

void from_json(const json &j, mcq_answer &value) {
    j.at("question_id").get_to(value.question_id);
    j.at("selected").get_to(value.selected);
}

void to_json(json &j, const solution &value) {
    j = {{"solution_id", value.solution_id},
         {"test_id", value.test_id},
         {"candidate_id", value.candidate_id},
         {"submitted_at", value.submitted_at},
         {"coding_answers", value.coding_answers},
         {"mcq_answers", value.mcq_answers}};
}

void from_json(const json &j, solution &value) {
    j.at("solution_id").get_to(value.solution_id);
    j.at("test_id").get_to(value.test_id);
    j.at("candidate_id").get_to(value.candidate_id);
    if (j.count("submitted_at")) j.at("submitted_at").get_to(value.submitted_at);
    if (j.count("coding_answers")) j.at("coding_answers").get_to(value.coding_answers);
    if (j.count("mcq_answers")) j.at("mcq_answers").get_to(value.mcq_answers);
}

void to_json(json &j, const execution_result &value) {
    j = {{"solution_id", value.solution_id},
         {"question_id", value.question_id},
         {"test_index", value.test_index},
         {"test_case_id", value.test_case_id},
         {"status", get_status_name(value.result)},
         {"passed", value.passed},
         {"error_kind", value.error ? json(get_kind_name(*value.error)) : json()},
         {"error_message", value.error_message},
         {"actual_output", value.actual_output},
         {"expected_output", value.expected_output},
         {"stdout", value.stdout_text},
         {"stderr", value.stderr_text},
         {"exit_code", value.exit_code},
         {"signal", value.signal},
         {"execution_time", value.execution_time},
         {"memory_usage", value.memory_usage},
         {"weight", value.weight}};
}

void from_json(const json &j, execution_result &value) {
    j.at("solution_id").get_to(value.solution_id);
    j.at("question_id").get_to(value.question_id);
    j.at("test_index").get_to(value.test_index);
    j.at("test_case_id").get_to(value.test_case_id);
    value.result = parse_status(j.at("status").get<string>());
    j.at("passed").get_to(value.passed);
    if (j.count("error_kind") && !j.at("error_kind").is_null())
        value.error = parse_error_kind(j.at("error_kind").get<string>());
    else
        value.error.reset();
    j.at("error_message").get_to(value.error_message);
    value.actual_output = j.at("actual_output");
    value.expected_output = j.at("expected_output");
    j.at("stdout").get_to(value.stdout_text);
    j.at("stderr").get_to(value.stderr_text);
    j.at("exit_code").get_to(value.exit_code);
    j.at("signal").get_to(value.signal);
    j.at("execution_time").get_to(value.execution_time);
    j.at("memory_usage").get_to(value.memory_usage);
    if (j.count("weight")) j.at("weight").get_to(value.weight);
}

}  // namespace grader
