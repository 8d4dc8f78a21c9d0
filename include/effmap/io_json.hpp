#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "effmap/session.hpp"

namespace effmap {

struct SheetFailure {
    std::string sheet;
    std::string kind;
    std::string message;
};

nlohmann::json reportToJson(const SheetReport& report);

/**
 * @brief Run summary: `{"sheets": [...], "failures": [...]}`.
 *
 * Grids are summarised by their dimensions and counts; the values go to the
 * CSV exports.
 */
nlohmann::json summaryToJson(const std::vector<SheetReport>& reports,
                             const std::vector<SheetFailure>& failures);

void write_json_summary(const std::string& path, const std::vector<SheetReport>& reports,
                        const std::vector<SheetFailure>& failures);

}  // namespace effmap
