#include "PipelineConfig.hpp"
#include "SliceMerger.hpp"

#include <iostream>
#include <string>
#include <vector>

static int g_failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition) {
    g_failures++;
  }
}

static size_t countOf(const std::string &haystack, const std::string &needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    count++;
  }
  return count;
}

static hanzi::RecognitionResult slice(int index, const std::string &text) {
  hanzi::RecognitionResult result;
  result.sliceIndex = index;
  result.verticalOffset = index * 1400;
  result.text = text;
  return result;
}

int main() {
  std::cout << "=== Test SliceMerger ===" << std::endl << std::endl;

  hanzi::PipelineConfig config;
  hanzi::SliceMerger merger(config);

  {
    std::cout << "Duplicated overlap band:" << std::endl;
    hanzi::PipelineConfig narrow;
    narrow.mergeWindowChars = 8;
    hanzi::SliceMerger shortWindow(narrow);
    std::vector<hanzi::RecognitionResult> results = {
        slice(0, "这是前面的内容全文完"), slice(1, "全文完后续的内容")};
    auto merged = shortWindow.mergePage(results);
    check(merged.text == "这是前面的内容全文完后续的内容",
          "shared text is kept once");
    check(countOf(merged.text, "全文完") == 1, "\"全文完\" appears once");
    check(merged.collapsedOverlaps == 1, "one overlap collapsed");
    check(merged.removedChars == 3, "three duplicate characters removed");
  }

  {
    std::cout << "Short coincidences at a slice boundary:" << std::endl;
    auto words = merger.mergePage(
        {slice(0, "第一段讨论的是我们"), slice(1, "我们的计划如下")});
    check(words.text == "第一段讨论的是我们\n我们的计划如下",
          "a repeated two-character word is kept twice");
    check(words.removedChars == 0, "nothing removed for the word");

    auto numbers =
        merger.mergePage({slice(0, "今年收入增长了10"), slice(1, "10个百分点")});
    check(numbers.text == "今年收入增长了10\n10个百分点",
          "a repeated number is kept twice");
    check(numbers.collapsedOverlaps == 0, "no overlap collapsed for the number");

    auto lines = merger.mergePage(
        {slice(0, "上一段的结尾\n我们"), slice(1, "我们\n下一段的开头")});
    check(lines.text == "上一段的结尾\n我们\n下一段的开头",
          "a short line repeated whole is collapsed");
  }

  {
    std::cout << "Failed slice between two slices:" << std::endl;
    auto merged = merger.mergePage({slice(0, "前面的内容\n全文完结束"),
                                    slice(1, ""),
                                    slice(2, "全文完结束\n后面")});
    check(merged.text == "前面的内容\n全文完结束\n全文完结束\n后面",
          "slices around an empty one are concatenated");
    check(merged.removedChars == 0, "nothing aligned across the gap");

    auto missing = merger.mergePage(
        {slice(0, "前面的内容\n全文完结束"), slice(2, "全文完结束\n后面")});
    check(missing.text == "前面的内容\n全文完结束\n全文完结束\n后面",
          "slices around a missing index are concatenated");
  }

  {
    std::cout << "Unrelated slices:" << std::endl;
    std::vector<hanzi::RecognitionResult> results = {
        slice(0, "第一部分文字"), slice(1, "完全不同的段落")};
    auto merged = merger.mergePage(results);
    check(merged.text == "第一部分文字\n完全不同的段落",
          "no alignment means plain concatenation");
    check(merged.collapsedOverlaps == 0 && merged.removedChars == 0,
          "nothing is dropped");
  }

  {
    std::cout << "Whitespace differences inside the overlap:" << std::endl;
    std::vector<hanzi::RecognitionResult> results = {
        slice(0, "会议纪要\n第 三 段"), slice(1, "第三段\n下一段开始")};
    auto merged = merger.mergePage(results);
    check(merged.text == "会议纪要\n第 三 段\n下一段开始",
          "alignment ignores spaces and keeps the following line break");
  }

  {
    std::cout << "Single shared punctuation is not an overlap:" << std::endl;
    std::vector<hanzi::RecognitionResult> results = {slice(0, "上一句结束。"),
                                                     slice(1, "。下一句")};
    auto merged = merger.mergePage(results);
    check(merged.text == "上一句结束。\n。下一句",
          "punctuation-only match is ignored");
  }

  {
    std::cout << "Out-of-order completion:" << std::endl;
    std::vector<hanzi::RecognitionResult> results = {
        slice(2, "丙丙丙"), slice(0, "甲甲甲"), slice(1, "乙乙乙")};
    auto merged = merger.mergePage(results);
    check(merged.text == "甲甲甲\n乙乙乙\n丙丙丙", "slices merge in index order");
  }

  {
    std::cout << "Empty slices and pages:" << std::endl;
    std::vector<hanzi::RecognitionResult> results = {
        slice(0, "  "), slice(1, "唯一的内容"), slice(2, "")};
    check(merger.mergePage(results).text == "唯一的内容",
          "blank slices are skipped");

    auto document = merger.mergeDocument({"第一页", "", "第三页"});
    check(document.text == "第一页\n第三页", "empty pages are skipped");
  }

  {
    std::cout << "Search window:" << std::endl;
    check(merger.searchWindow(10, 10) == 16,
          "short slices use the configured minimum window");
    hanzi::PipelineConfig eighth;
    eighth.sliceHeightPx = 1000;
    eighth.overlapPx = 125;
    hanzi::SliceMerger wide(eighth);
    check(wide.searchWindow(1000, 400) == 250,
          "long slices use twice the overlap share");
    check(hanzi::SliceMerger::minimumAlignment(16) == 4 &&
              hanzi::SliceMerger::minimumAlignment(250) == 62 &&
              hanzi::SliceMerger::minimumAlignment(4) == 2,
          "alignments must cover a quarter of the window");
    check(hanzi::SliceMerger::findOverlap(U"abc全文完", U"全文完xyz", 16, 2) == 3,
          "findOverlap returns the covered prefix length");
    check(hanzi::SliceMerger::findOverlap(U"abc全文完", U"全文完xyz", 16, 4) == 0,
          "alignments below the minimum are rejected");
    check(hanzi::SliceMerger::findOverlap(U"上文\n全文完", U"全文完\n下文", 16,
                                          4) == 3,
          "whole-line alignments below the minimum are accepted");
    check(hanzi::SliceMerger::findOverlap(U"全文完", U"全文完", 2, 2) == 0,
          "matches longer than the window are not searched");
  }

  std::cout << std::endl
            << (g_failures == 0 ? "All tests passed" : "Some tests FAILED")
            << std::endl;
  return g_failures == 0 ? 0 : 1;
}
