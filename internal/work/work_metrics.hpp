#pragma once

#include <string_view>

namespace workbundle::work {

// Series recorded into an injected MetricsRegistry.
inline constexpr std::string_view kMetricConvergeCreated    = "workbundle_converge_created_total";
inline constexpr std::string_view kMetricConvergeUpdated    = "workbundle_converge_updated_total";
inline constexpr std::string_view kMetricConvergeUnchanged  = "workbundle_converge_unchanged_total";
inline constexpr std::string_view kMetricConvergeErrors     = "workbundle_converge_errors_total";
inline constexpr std::string_view kMetricConvergeDurationMs = "workbundle_converge_duration_ms";
inline constexpr std::string_view kMetricDeleted            = "workbundle_delete_total";
inline constexpr std::string_view kMetricDeleteAbsent       = "workbundle_delete_absent_total";
inline constexpr std::string_view kMetricDeleteErrors       = "workbundle_delete_errors_total";

} // namespace workbundle::work
