#pragma once

class ConfigManager;

namespace config
{

// Binds the [diagnostics] table (verbose, max_preview) to payments::Diagnostics
bool registerDiagnosticsSettings(ConfigManager& manager);

} // namespace config
