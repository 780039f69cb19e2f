/**
 * @file html_report.cpp
 * @brief HTML test report rendering
 */

#include "rfuri/report/html.hpp"

#include <format>
#include <utility>

namespace rfuri::report {

namespace {

constexpr std::string_view kStyle = R"(    <style>
      .pass {background-color:#99EE99}
      .fail {background-color:#EE9999}
      .warn {background-color:#EEEE99}
      .bluebg {background-color:#BDD6EE}
      .center {text-align:center;}
      .titlerow {border: 2pt solid}
      body {background-color:lightgrey; border: 1pt solid; text-align:center; margin-left:auto; margin-right:auto}
      th {text-align:center; background-color:beige; border: 1pt solid}
      td {text-align:left; background-color:white; border: 1pt solid; word-wrap:break-word;}
      table {width:90%; margin: 0px auto; table-layout:fixed;}
    </style>
)";

[[nodiscard]] std::string_view css_class_of(classifier::Outcome outcome)
{
    switch (outcome) {
        case classifier::Outcome::kPass:
            return "pass center";
        case classifier::Outcome::kWarning:
            return "warn center";
        case classifier::Outcome::kFail:
            return "fail center";
    }
    return "fail center";
}

void append_uri_rows(std::string& html, const validation::ValidationResult& result)
{
    for (const auto& [uri, verdict] : result.uris) {
        const std::string_view label = classifier::to_string(verdict.outcome);
        html += "<tr><td>" + escape_html(uri) + "</td>";
        html += std::format("<td class=\"{}\" width=\"30%\">{}", css_class_of(verdict.outcome), label);
        if (verdict.outcome != classifier::Outcome::kPass) {
            html += ": " + escape_html(verdict.details);
        }
        html += "</td></tr>\n";
    }
}

void append_orphan_rows(std::string& html, const validation::ValidationResult& result)
{
    const std::string details = escape_html(classifier::orphan_details(result.identifier_property));
    for (const auto& orphan : result.orphans) {
        html += "<tr><td><pre>" + escape_html(resource::node_to_json(orphan.root).dump(4))
                + "</pre></td>";
        html += "<td class=\"fail center\" width=\"30%\">Fail: " + details + "</td></tr>\n";
    }
}

}  // namespace

std::string escape_html(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&#39;";
                break;
            default:
                escaped.push_back(c);
        }
    }
    return escaped;
}

HtmlReportWriter::HtmlReportWriter(ReportBranding branding)
    : m_branding(std::move(branding))
{}

std::string HtmlReportWriter::render(const validation::ValidationResult& result,
                                     const ReportContext& context) const
{
    std::string html;
    html += "<html>\n  <head>\n    <title>Redfish URI Test Summary</title>\n";
    html += kStyle;
    html += "  </head>\n  <body>\n  <table>\n";

    html += "    <tr><th>\n      <h2>##### Redfish URI Test Report #####</h2>\n";
    if (!m_branding.logo_base64.empty()) {
        html += std::format(
            "      <h4><img align=\"center\" alt=\"Logo\" src=\"data:image/gif;base64,{}\"></h4>\n",
            escape_html(m_branding.logo_base64));
    }
    if (!m_branding.project_url.empty()) {
        const std::string url = escape_html(m_branding.project_url);
        html += std::format("      <h4><a href=\"{}\">{}</a></h4>\n", url, url);
    }
    html += std::format("      {} Version: {}<br/>\n      {}<br/>\n    </th></tr>\n",
                        escape_html(m_branding.tool_name),
                        escape_html(m_branding.tool_version),
                        escape_html(context.generated_at));

    html += std::format("    <tr><th>\n      System: {}<br/>\n      OpenAPI Specification: {}<br/>\n"
                        "    </th></tr>\n",
                        escape_html(context.system),
                        escape_html(context.openapi_path));

    html += std::format("    <tr><td>\n      <center><b>Results Summary</b></center>\n"
                        "      <center>Pass: {}, Fail: {}, Warning: {}</center>\n    </td></tr>\n",
                        result.total_pass,
                        result.total_fail,
                        result.total_warn);

    html += "    <tr><th class=\"titlerow bluebg\"><b>Results</b></th></tr>\n";
    if (!result.uris.empty() || !result.orphans.empty()) {
        html += "    <tr><td><table>\n";
        append_uri_rows(html, result);
        append_orphan_rows(html, result);
        html += "    </table></td></tr>\n";
    }

    html += "  </table>\n  </body>\n</html>\n";
    return html;
}

rfuri::VoidResult HtmlReportWriter::write(const validation::ValidationResult& result,
                                          const ReportContext& context,
                                          const std::filesystem::path& output_path) const
{
    return common::write_text_file(output_path, render(result, context));
}

}  // namespace rfuri::report
