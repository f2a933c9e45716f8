#ifndef CNP_ANALYZER_CNP_EXTRACTOR_PARANOID_H_
#define CNP_ANALYZER_CNP_EXTRACTOR_PARANOID_H_

#include <deque>
#include <string>
#include <vector>

#include "CNPExtractor.hpp"

// In PARANOID mode any 13 digits count as a candidate, whatever separates
// them, as long as no two neighbours are more than 2 characters apart. A
// monotonic deque keeps the largest gap of the current window.
class CNPExtractorParanoid : public CNPExtractor {
 public:
  void Process(const std::string& text) override {
    std::vector<size_t> digit_indexes;
    for (size_t i = 0; i < text.size(); ++i) {
      if (CNPUtil::IsDigit(text[i])) {
        digit_indexes.push_back(i);
      }
    }

    if (digit_indexes.size() < kCNPLength) {
      return;
    }

    // gaps[i] is the number of characters between digit i and digit i + 1.
    std::vector<size_t> gaps(digit_indexes.size() - 1);
    for (size_t i = 1; i < digit_indexes.size(); ++i) {
      gaps[i - 1] = digit_indexes[i] - digit_indexes[i - 1] - 1;
    }

    // A window of 13 digits spans 12 gaps. The deque holds gap indexes with
    // decreasing gap sizes, so its front is the window maximum.
    std::deque<size_t> q;

    auto AddBack = [&] (size_t gap_index) {
      while (!q.empty() && gaps[q.back()] <= gaps[gap_index]) {
        q.pop_back();
      }
      q.push_back(gap_index);
    };

    auto RemoveFront = [&] (size_t window_start) {
      if (!q.empty() && q.front() <= window_start) {
        q.pop_front();
      }
    };

    // start and end are digit indexes, the window covers gaps [start, end).
    auto ProcessWindow = [&] (size_t start, size_t end) {
      const size_t max_in_between = 2;

      if (gaps[q.front()] > max_in_between) return;
      if (text[digit_indexes[start]] == '0') return;

      size_t first = digit_indexes[start];
      size_t last = digit_indexes[end];
      if (IsEmbedded(text, first, last - first + 1)) return;

      std::string match;
      for (size_t i = start; i <= end; ++i) {
        match += text[digit_indexes[i]];
      }
      Matched(match);
    };

    size_t window_start = 0;
    size_t window_end = kCNPLength - 1;
    for (size_t i = window_start; i < window_end; ++i) {
      AddBack(i);
    }

    while (window_end < gaps.size()) {
      ProcessWindow(window_start, window_end);
      RemoveFront(window_start);
      AddBack(window_end);
      ++window_start;
      ++window_end;
    }

    // Last window.
    ProcessWindow(window_start, window_end);
  }
};

#endif  // CNP_ANALYZER_CNP_EXTRACTOR_PARANOID_H_
