#pragma once

namespace prism {

// Registers the plugins compiled into prism_cli with the PluginFactoryRegistry:
//   builtin:echo          responds with request["message"] (or the whole request)
//   builtin:require_user  short-circuits with "unauthorized" when no user_id is present
//   builtin:static_file   responds with the file named by request["file"], read via the SDK
void register_builtin_plugins();

} // namespace prism
