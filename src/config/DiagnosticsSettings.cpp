#include "DiagnosticsSettings.hpp"
#include "ConfigManager.hpp"
#include "../payments/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include <plog/Log.h>

namespace config
{

bool registerDiagnosticsSettings(ConfigManager& manager)
{
    TableCallbacks callbacks;
    callbacks.load = [](const toml::table& section)
    {
        payments::Diagnostics::SetVerbose(section["verbose"].value_or(false));

        if (auto preview = section["max_preview"].value<int64_t>())
        {
            if (*preview > 0)
            {
                payments::Diagnostics::SetMaxPreview(static_cast<std::size_t>(*preview));
            }
            else
            {
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                    "Ignoring invalid diagnostics.max_preview",
                                                    "max_preview = " + std::to_string(*preview));
            }
        }

        PLOG_DEBUG << "Diagnostics verbose=" << payments::Diagnostics::IsVerbose()
                   << " max_preview=" << payments::Diagnostics::MaxPreview();
    };

    return manager.registerTable("diagnostics", std::move(callbacks), { "verbose", "max_preview" });
}

} // namespace config
