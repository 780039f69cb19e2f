#pragma once

/**
 * @file html.hpp
 * @brief HTML test report
 */

#include "rfuri/common.hpp"
#include "rfuri/report.hpp"
#include "rfuri/validation.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace rfuri::report {

class HtmlReportWriter
{
public:
    explicit HtmlReportWriter(ReportBranding branding);

    [[nodiscard]] std::string render(const validation::ValidationResult& result,
                                     const ReportContext& context) const;

    [[nodiscard]] rfuri::VoidResult write(const validation::ValidationResult& result,
                                          const ReportContext& context,
                                          const std::filesystem::path& output_path) const;

private:
    ReportBranding m_branding;
};

/// Escape text for HTML element content and attribute values
[[nodiscard]] std::string escape_html(std::string_view text);

}  // namespace rfuri::report
