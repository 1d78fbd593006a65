#include "simdbuild/build/compile_unit.hpp"

#include "simdbuild/build/dependency_tracker.hpp"

#include <algorithm>

namespace simdbuild::build {

std::vector<fs::path> SourcePlan::expected_outputs() const {
    std::vector<fs::path> out;
    out.reserve(units.size() + 1);
    for (const auto& unit : units) {
        out.push_back(unit.object);
    }
    out.push_back(header);
    return out;
}

auto output_base(const std::string& stem) -> std::string {
    return stem + "_ispc";
}

auto plan_sources(const std::vector<fs::path>& sources, std::span<const TargetIsa> isas,
                  const fs::path& out_dir) -> std::vector<SourcePlan> {
    std::vector<TargetIsa> ordered(isas.begin(), isas.end());
    if (ordered.empty()) {
        ordered.push_back(TargetIsa::Host);
    }
    std::sort(ordered.begin(), ordered.end());
    bool multi = ordered.size() > 1;

    std::vector<SourcePlan> plans;
    plans.reserve(sources.size());
    for (const auto& source : sources) {
        SourcePlan plan;
        plan.source = source;
        plan.stem = source.stem().string();
        auto base = output_base(plan.stem);
        plan.header = out_dir / (base + ".h");
        plan.dep_file = out_dir / (base + ".idep");
        plan.record = out_dir / (base + ".deprec");

        auto primary = out_dir / (base + ".o");
        if (!multi) {
            plan.units.push_back(CompileUnit{source, ordered.front(), primary});
        } else {
            plan.units.push_back(CompileUnit{source, std::nullopt, primary});
            for (auto isa : ordered) {
                auto object = out_dir / (base + "_" + std::string(target::isa_suffix(isa)) + ".o");
                plan.units.push_back(CompileUnit{source, isa, object});
            }
        }
        plans.push_back(std::move(plan));
    }
    return plans;
}

auto collect_artifacts(const std::vector<SourcePlan>& plans)
    -> BuildResult<std::vector<GeneratedArtifact>> {
    std::vector<GeneratedArtifact> artifacts;
    for (const auto& plan : plans) {
        for (const auto& unit : plan.units) {
            auto mtime = file_mtime(unit.object);
            if (!mtime) {
                return make_error(ErrorKind::LinkFailure,
                                  "Missing object file " + unit.object.string() + " for " +
                                      plan.source.string());
            }
            artifacts.push_back(GeneratedArtifact{unit.object, unit.isa, *mtime});
        }
    }
    return artifacts;
}

} // namespace simdbuild::build
