#ifndef LANWATCH_REPORT_HPP
#define LANWATCH_REPORT_HPP

#include <lanwatch/snapshot.hpp>

#include <cstddef>
#include <string>
#include <vector>

constexpr size_t NAME_COLUMN_WIDTH = 28;

std::string render_wired_table(const std::vector<WiredHost>& hosts);
std::string render_short_range_table(const std::vector<ShortRangeDevice>& devices);

// both tables followed by any warnings recorded in the snapshot
std::string render_report(const ResultSnapshot& snapshot);

#endif
