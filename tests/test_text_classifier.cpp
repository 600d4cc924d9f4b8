/**
 * @file test_text_classifier.cpp
 * @brief Document classification and preprocessing tests
 */

#include "core/document/text_classifier.h"
#include <iostream>

using namespace slopgraph;
using namespace slopgraph::document;

void print_result(const std::string& test_name, bool passed) {
    std::cout << "[" << (passed ? "PASS" : "FAIL") << "] " << test_name << std::endl;
}

template<typename T>
static bool featureIs(const DocumentMetadata& metadata, const std::string& name, const T& expected) {
    auto it = metadata.features.find(name);
    if (it == metadata.features.end()) return false;
    auto* value = std::get_if<T>(&it->second);
    return value && *value == expected;
}

bool test_conversation() {
    std::cout << "\n=== Testing conversation detection ===" << std::endl;

    TextClassifier classifier;
    auto metadata = classifier.classify(
        "Alice: Hey, what do you think about distributed systems?\n"
        "\n"
        "Bob: Well, I think consensus algorithms are fascinating. Have you looked into Raft?\n"
        "\n"
        "Alice: Yeah! The leader election process is elegant.\n"
        "\n"
        "Bob: PBFT is the classic algorithm, but it has some limitations...\n");

    bool type_ok = metadata.doc_type == DocumentType::CONVERSATION;
    print_result("Speaker lines classify as conversation", type_ok);

    bool confidence_ok = metadata.confidence > 0.57 && metadata.confidence < 0.58;
    print_result("Confidence is the matching line share (4/7)", confidence_ok);

    bool features_ok = featureIs<int64_t>(metadata, "line_count", 7) &&
                       featureIs<int64_t>(metadata, "conversation_markers", 4) &&
                       featureIs<bool>(metadata, "has_speakers", true) &&
                       featureIs<bool>(metadata, "has_headers", false);
    print_result("Line and marker features", features_ok);

    bool title_ok = metadata.suggested_title == "Alice: Hey, what do you think...";
    print_result("Title falls back to first substantial line", title_ok);

    return type_ok && confidence_ok && features_ok && title_ok;
}

bool test_markdown() {
    std::cout << "\n=== Testing markdown detection ===" << std::endl;

    TextClassifier classifier;
    auto metadata = classifier.classify(
        "# My Project\n"
        "\n"
        "This is a **bold** statement about AI.\n"
        "\n"
        "- First item\n"
        "- Second item\n"
        "\n"
        "```python\n"
        "def hello():\n"
        "    print(\"world\")\n"
        "```\n");

    bool type_ok = metadata.doc_type == DocumentType::MARKDOWN;
    print_result("Headers and fences classify as markdown", type_ok);

    bool features_ok = featureIs<int64_t>(metadata, "line_count", 11) &&
                       featureIs<int64_t>(metadata, "markdown_markers", 3) &&
                       featureIs<bool>(metadata, "has_headers", true);
    print_result("Markdown features", features_ok);

    bool title_ok = metadata.suggested_title == "My Project";
    print_result("Title taken from first header", title_ok);

    return type_ok && features_ok && title_ok;
}

bool test_structured_and_plain() {
    std::cout << "\n=== Testing structured and plain text ===" << std::endl;

    TextClassifier classifier;

    auto structured = classifier.classify("INTRODUCTION:\n1. Scope\n2. Terms\n---\n| a | b |");
    bool structured_ok = structured.doc_type == DocumentType::STRUCTURED && structured.confidence == 1.0;
    print_result("Sections, rules and tables classify as structured", structured_ok);

    auto plain = classifier.classify("The weather was nice today and we walked to the park.");
    bool plain_ok = plain.doc_type == DocumentType::PLAIN_TEXT &&
                    plain.confidence == TextClassifier::kFallbackConfidence;
    print_result("Low scores fall back to plain text at 0.5", plain_ok);

    bool plain_title_ok = plain.suggested_title == "The weather was nice today and...";
    print_result("Long first line truncated to six words", plain_title_ok);

    bool plain_features_ok = featureIs<int64_t>(plain, "line_count", 1) &&
                             featureIs<bool>(plain, "has_speakers", false) &&
                             featureIs<double>(plain, "avg_line_length", 53.0);
    print_result("Plain text features", plain_features_ok);

    auto short_text = classifier.classify("tiny");
    bool no_title_ok = !short_text.suggested_title.has_value();
    print_result("No title for short lines", no_title_ok);

    auto empty = classifier.classify("   \n\t ");
    bool empty_ok = empty.doc_type == DocumentType::RANDOM && empty.confidence == 0.0 &&
                    empty.features.empty() && !empty.suggested_title.has_value();
    print_result("Whitespace-only input is random", empty_ok);

    return structured_ok && plain_ok && plain_title_ok && plain_features_ok && no_title_ok && empty_ok;
}

bool test_preprocess() {
    std::cout << "\n=== Testing preprocessing ===" << std::endl;

    auto cleaned = TextClassifier::preprocess(
        "Use **Raft**  for\n\n*consensus* and `etcd`.\n```\ncode here\n```\nDone  ");
    bool cleaned_ok = cleaned == "Use Raft for consensus and etcd. Done";
    print_result("Markers, fences and whitespace removed", cleaned_ok);
    if (!cleaned_ok) std::cerr << "got: " << cleaned << std::endl;

    bool plain_ok = TextClassifier::preprocess("already clean") == "already clean";
    print_result("Clean text unchanged", plain_ok);

    return cleaned_ok && plain_ok;
}

bool test_large_inputs() {
    std::cout << "\n=== Testing megabyte inputs ===" << std::endl;

    const std::string block(1 << 20, 'x');

    auto fenced = TextClassifier::preprocess("# Notes\n\n```\n" + block + "\n```\nafter the block");
    bool fenced_ok = fenced == "# Notes after the block";
    print_result("1 MB fenced block removed", fenced_ok);

    auto unclosed = TextClassifier::preprocess("```\n" + block);
    bool unclosed_ok = unclosed == "` " + block;
    print_result("Unclosed fence keeps its text", unclosed_ok);

    auto bold = TextClassifier::preprocess("**" + block + "** and *" + block + "*");
    bool bold_ok = bold == block + " and " + block;
    print_result("1 MB bold and italic spans unwrapped", bold_ok);

    TextClassifier classifier;
    auto link = classifier.classify("[" + block + "](http://example.com)\nplain closing line");
    bool link_ok = link.doc_type == DocumentType::MARKDOWN &&
                   featureIs<int64_t>(link, "markdown_markers", 1) &&
                   link.confidence == 0.5;
    print_result("1 MB link line counted as markdown", link_ok);

    auto code = classifier.classify(block + " `etcd`");
    bool code_ok = code.doc_type == DocumentType::MARKDOWN && featureIs<int64_t>(code, "line_count", 1);
    print_result("Inline code found at the end of a 1 MB line", code_ok);

    auto speaker = classifier.classify("Alice: " + block);
    bool speaker_ok = speaker.doc_type == DocumentType::CONVERSATION && speaker.confidence == 1.0;
    print_result("Speaker prefix found on a 1 MB line", speaker_ok);

    return fenced_ok && unclosed_ok && bold_ok && link_ok && code_ok && speaker_ok;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Text Classifier Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;

    int passed = 0;
    int total = 5;

    if (test_conversation()) passed++;
    if (test_markdown()) passed++;
    if (test_structured_and_plain()) passed++;
    if (test_preprocess()) passed++;
    if (test_large_inputs()) passed++;

    std::cout << "\n========================================" << std::endl;
    std::cout << "Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
