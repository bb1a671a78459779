/*
 * <Saddle main file.>
 * Copyright (C) 2025 - 2026 The Saddle authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "src/capabilities/constrained_relaxer.h"
#include "src/capabilities/core_selector.h"
#include "src/capabilities/fragment_stripper.h"
#include "src/capabilities/model_potential.h"
#include "src/capabilities/peak_finder.h"
#include "src/capabilities/relaxed_scan.h"
#include "src/capabilities/ts_guess.h"

#include "src/core/bond_rearrangement.h"
#include "src/core/global.h"
#include "src/core/saddle_logger.h"
#include "src/core/structure.h"
#include "src/core/units.h"

#include "src/tools/formats.h"
#include "src/tools/general.h"
#include "src/tools/scan_profile_writer.h"

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace saddle;

static const json CoreCommandJson = {
    { "active", "" },
    { "forming", "" },
    { "breaking", "" },
    { "pi", "" },
    { "verbosity", 2 }
};

static const json ScanCommandJson = {
    { "bond", "" },
    { "active", "" },
    { "name", "" },
    { "verbosity", 2 }
};

struct CapabilityInfo {
    std::string description;
    std::string usage;
    std::function<int(const json&)> handler;
};

namespace {

std::string InputFile(const json& parameter)
{
    if (!parameter.contains("file"))
        throw InputError("no input file given");
    return parameter["file"].get<std::string>();
}

int executeCore(const json& controller)
{
    json parameter = MergeJson(MergeJson(CoreCommandJson, MergeJson(CoreSelectorJson, FragmentStripperJson)), controller);
    SaddleLogger::initialize(Json2KeyWord<int>(parameter, "verbosity"));
    SaddleLogger::header("Reactive core extraction");
    SaddleLogger::param_table(parameter, "Parameters");

    const std::string file = InputFile(parameter);
    Structure structure = Files::LoadStructure(file);

    BondRearrangement rearrangement(Tools::CreatePairList(parameter["forming"]), Tools::CreatePairList(parameter["breaking"]));
    rearrangement.Validate(structure);

    std::vector<int> active = Tools::CreateIndexList(parameter["active"]);
    if (active.empty())
        active = rearrangement.ActiveAtoms();
    structure.setActiveAtoms(active);
    structure.setPiBonds(Tools::CreatePairList(parameter["pi"]));

    CoreAtomSelector selector(parameter);
    auto core = selector.Select(structure);
    if (!core)
        return 1;

    FragmentStripper stripper(parameter);
    StripResult result = stripper.Strip(structure, core, rearrangement);

    result.structure.print_geom();
    const std::string output = Files::Basename(file) + "_core.xyz";
    result.structure.writeXYZFile(output);

    SaddleLogger::param("atoms", static_cast<int>(result.structure.AtomCount()));
    SaddleLogger::param("capping hydrogens", result.capping_atoms);
    SaddleLogger::param("core atoms", Tools::Vector2String(std::vector<int>(core->begin(), core->end()), ","));
    SaddleLogger::param("forming", Tools::Pairs2String(result.bond_rearrangement.FormingBonds()));
    SaddleLogger::param("breaking", Tools::Pairs2String(result.bond_rearrangement.BreakingBonds()));
    SaddleLogger::result_raw(result.bond_rearrangement.toString());
    SaddleLogger::success_fmt("Fragment with {} atoms written to {}", result.structure.AtomCount(), output);
    return 0;
}

int executeScan(const json& controller)
{
    json parameter = MergeJson(ScanCommandJson,
        MergeJson(TSGuessScanJson,
            MergeJson(ConstrainedRelaxerJson, MorseBondPotentialJson)));
    parameter = MergeJson(parameter, controller);
    SaddleLogger::initialize(Json2KeyWord<int>(parameter, "verbosity"));
    SaddleLogger::header("One dimensional relaxed scan");
    SaddleLogger::param_table(parameter, "Parameters");

    const std::string file = InputFile(parameter);
    const std::string basename = Files::Basename(file);
    Structure structure = Files::LoadStructure(file);

    auto bonds = Tools::CreatePairList(parameter["bond"]);
    if (bonds.size() != 1)
        throw InputError("exactly one scanned bond i:j is needed");
    const IntPair pair = bonds.front();
    structure.CheckPair(pair);

    const int steps = Json2KeyWord<int>(parameter, "steps");
    const double delta = Json2KeyWord<double>(parameter, "delta");
    std::string name = Json2KeyWord<std::string>(parameter, "name");
    if (name.empty())
        name = basename + "_ts_guess";

    auto potential = std::make_shared<MorseBondPotential>(structure, parameter);
    ConstrainedRelaxer relaxer(potential);

    const double start = structure.BondDistance(pair);
    auto points = RunRelaxedScan(structure, pair, start, start + delta, steps, relaxer, parameter);

    const std::string trajectory = basename + "_scan.xyz";
    Structure frame = structure;
    for (const auto& point : points) {
        if (!point.Success())
            continue;
        if (!frame.setGeometry(point.getGeometry()))
            throw InputError(fmt::format("scan geometry at r = {:.4f} does not fit {}", point.Distance(), basename));
        frame.setEnergy(point.Energy());
        frame.setName(fmt::format("{}_r_{:.4f}", basename, point.Distance()));
        frame.appendXYZFile(trajectory);
    }

    ScanProfileWriter writer(basename + "_scan");
    auto peak = FindPeak(points, &writer);

    std::optional<Geometry> peak_geometry;
    if (peak) {
        peak_geometry = peak->geometry;
        SaddleLogger::energy_abs(peak->energy, "Energy at the peak");
        SaddleLogger::energy_rel(peak->barrier, "Barrier");
    }
    auto guess = AssembleTSGuess(structure, peak_geometry, pair, Tools::CreatePairList(parameter["active"]),
        name, Json2KeyWord<std::string>(parameter, "reaction_class"));
    if (!guess)
        return 1;

    guess->structure.setEnergy(peak->energy);
    const std::string output = basename + "_ts_guess.xyz";
    guess->structure.writeXYZFile(output);
    SaddleLogger::param("active bonds", Tools::Pairs2String(guess->active_bonds));
    SaddleLogger::success_fmt("Transition state guess written to {}", output);
    return 0;
}

const std::map<std::string, CapabilityInfo> CAPABILITY_REGISTRY = {
    { "core", { "Strip a structure to the reactive core around the active atoms",
                  "saddle -core input.xyz -active 0,1,30 -depth 3 -forming 1:30 -breaking 0:1 [-pi 2:3] [-keep_rings false] [-cap_hydrogens false]",
                  executeCore } },
    { "scan", { "Relaxed scan along one bond and transition state guess at the maximum",
                  "saddle -scan input.xyz -bond 0:1 -steps 10 -delta 1.5 [-active 1:30] [-max_iter 500]",
                  executeScan } }
};

void showHelp()
{
    std::cout << "Saddle - reactive cores and transition state guesses" << std::endl
              << std::endl;
    for (const auto& capability : CAPABILITY_REGISTRY) {
        std::cout << " -" << capability.first << "    " << capability.second.description << std::endl;
        std::cout << "     " << capability.second.usage << std::endl
                  << std::endl;
    }
}

}

int main(int argc, char** argv)
{
    SaddleLogger::initialize(2, true);

    if (argc < 2) {
        showHelp();
        return 1;
    }

    std::string command = CommandKeyword(argv[1]);
    if (command.empty()) {
        SaddleLogger::error_fmt("Expected a command like -core or -scan, got '{}'", argv[1]);
        showHelp();
        return 1;
    }
    if (command == "help" || command == "h") {
        showHelp();
        return 0;
    }

    auto it = CAPABILITY_REGISTRY.find(command);
    if (it == CAPABILITY_REGISTRY.end()) {
        SaddleLogger::error_fmt("Unknown command -{}", command);
        showHelp();
        return 1;
    }

    RunTimer timer(false);
    try {
        json controller = CLI2Json(argc, argv);
        int result = it->second.handler(controller[command]);
        SaddleLogger::info_fmt("Finished after {:.2f} seconds", timer.Elapsed() / 1000.0);
        return result;
    } catch (const std::exception& error) {
        SaddleLogger::error(error.what());
        return 1;
    }
}
