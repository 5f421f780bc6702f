#include "cmd_build.hpp"

namespace cannyup::cli {

Status run_build(CommandContext& ctx, BuildProfile profile) {
    Builder builder(ctx.runner, ctx.config.source_root, ctx.config.binary_name);
    auto artifact = builder.build(profile, ctx.env);
    if (is_err(artifact)) {
        return unwrap_err(artifact);
    }
    ctx.status.success(std::string("Built ") + profile_name(profile) + " binary " +
                       unwrap(artifact).output_path.string());
    return Unit{};
}

Status run_cargo_task(CommandContext& ctx, CargoTask task) {
    Builder builder(ctx.runner, ctx.config.source_root, ctx.config.binary_name);
    return builder.run_task(task, ctx.env);
}

} // namespace cannyup::cli
