#include "builtin_plugins.h"

#include "prism/interception.h"
#include "prism/plugin_api.h"
#include "prism/request_context.h"
#include "prism/sdk.h"

#include <mutex>

namespace prism {

namespace {

class EchoPlugin : public Plugin {
public:
    StepResult handle(RequestContext& ctx) override {
        if (auto msg = json_mini::string_at(ctx.request_data(), "message")) {
            ctx.respond_text(*msg);
        } else {
            ctx.respond(json_mini::Doc{json_object_get(ctx.request_data())});
        }
        return StepResult::Continue;
    }
};

class RequireUserPlugin : public Plugin {
public:
    StepResult handle(RequestContext& ctx) override {
        if (!ctx.user_id()) {
            ctx.error("authentication required", "unauthorized");
            return StepResult::Stop;
        }
        ctx.set_string("authenticated_user", *ctx.user_id());
        return StepResult::Continue;
    }
};

// Reads files relative to its own plugin directory.
class StaticFilePlugin : public Plugin {
public:
    StepResult handle(RequestContext& ctx) override {
        auto name = json_mini::string_at(ctx.request_data(), "file");
        if (!name) {
            ctx.error("missing 'file'", "bad_request");
            return StepResult::Stop;
        }
        std::filesystem::path base;
        if (auto* engine = InterceptionEngine::active()) {
            if (auto root = engine->plugin_root(ctx.current_plugin())) base = *root;
        }
        ctx.respond_text(sdk::read_file(base / *name));
        return StepResult::Continue;
    }
};

} // namespace

void register_builtin_plugins() {
    static std::once_flag once;
    std::call_once(once, [] {
        static PluginRegistration<EchoPlugin> echo("echo");
        static PluginRegistration<RequireUserPlugin> require_user("require_user");
        static PluginRegistration<StaticFilePlugin> static_file("static_file");
    });
}

} // namespace prism
