#include "analyzer/analyzer.hpp"
#include "analyzer/ai_detection.hpp"
#include "analyzer/naming.hpp"
#include "analyzer/performance.hpp"
#include "analyzer/quality.hpp"
#include "analyzer/style.hpp"

namespace grader {
using namespace std;

vector<unique_ptr<analyzer>> make_static_analyzers() {
    vector<unique_ptr<analyzer>> analyzers;
    analyzers.push_back(make_unique<code_quality_analyzer>());
    analyzers.push_back(make_unique<ai_detection_analyzer>());
    analyzers.push_back(make_unique<style_analyzer>());
    analyzers.push_back(make_unique<performance_analyzer>());
    analyzers.push_back(make_unique<naming_analyzer>());
    return analyzers;
}

}  // namespace grader
