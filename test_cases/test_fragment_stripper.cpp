/*
 * <Tests for the reduction of structures to their reactive core.>
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

#include "src/capabilities/core_selector.h"
#include "src/capabilities/fragment_stripper.h"
#include "src/core/elements.h"
#include "src/core/saddle_logger.h"

#include "test_cases/test_fixtures.h"
#include "test_cases/test_utils.h"

#include <iostream>
#include <memory>

using namespace saddle;

namespace {

std::set<int> Depth2Core()
{
    return { 0, 1, 2, 6, 7, 8, 11, 12, 13, 21, 22, 23, 24, 30, 31 };
}

}

void test_strip_sn2_core(SaddleTest& tester)
{
    std::cout << "\n=== Testing Stripping of the SN2 Complex ===" << std::endl;

    Structure complex = fixtures::ReactantComplex();
    FragmentStripper stripper;
    StripResult result = stripper.Strip(complex, Depth2Core(), fixtures::SN2Rearrangement());

    tester.assert_true(result.stripped, "structure was stripped");
    tester.assert_equal(17, result.structure.AtomCount(), 1e-10, "15 core atoms and 2 caps");
    tester.assert_equal(2, result.capping_atoms, 1e-10, "C2-C3 and C8-C9 are capped");
    tester.assert_true(result.structure.IsFragment(), "result is a fragment");
    tester.assert_true(result.structure.Name() == "sn2_complex_core", "fragment name");
    tester.assert_equal(-1, result.structure.Charge(), 1e-10, "charge carried over");

    tester.assert_true(result.bond_rearrangement == BondRearrangement({ { 1, 13 } }, { { 0, 1 } }), "remapped rearrangement " + result.bond_rearrangement.toString());
    tester.assert_equal(13, result.NewIndex(30), 1e-10, "oxygen index");
    tester.assert_equal(-1, result.NewIndex(3), 1e-10, "removed atom has no index");
}

void test_order_preservation(SaddleTest& tester)
{
    std::cout << "\n=== Testing Atom Order ===" << std::endl;

    Structure complex = fixtures::ReactantComplex();
    FragmentStripper stripper;
    StripResult result = stripper.Strip(complex, Depth2Core(), fixtures::SN2Rearrangement());

    int index = 0;
    for (int atom : Depth2Core()) {
        tester.assert_equal(complex.Element(atom), result.structure.Element(index), 1e-10, "element of core atom " + std::to_string(atom));
        tester.assert_equal(0.0, (complex.getPosition(atom) - result.structure.getPosition(index)).norm(), 1e-12, "position of core atom " + std::to_string(atom));
        ++index;
    }
    tester.assert_true(result.structure.Graph().HasBond(3, 4) && result.structure.Graph().HasBond(3, 5) && result.structure.Graph().HasBond(4, 5), "ring bonds renumbered");
    tester.assert_true(!result.structure.Graph().HasBond(1, 13), "forming bond is not in the graph");
}

void test_capping_hydrogens(SaddleTest& tester)
{
    std::cout << "\n=== Testing Capping Hydrogens ===" << std::endl;

    Structure complex = fixtures::ReactantComplex();
    FragmentStripper stripper;
    StripResult result = stripper.Strip(complex, Depth2Core(), fixtures::SN2Rearrangement());
    const Structure& fragment = result.structure;

    const double ch = Elements::CovalentRadius[6] + Elements::CovalentRadius[1];
    tester.assert_equal(1, fragment.Element(15), 1e-10, "first cap is a hydrogen");
    tester.assert_equal(1, fragment.Element(16), 1e-10, "second cap is a hydrogen");
    tester.assert_equal(ch, fragment.CalculateDistance(2, 15), 1e-10, "cap on C2 at the C-H bond length");
    tester.assert_equal(ch, fragment.CalculateDistance(5, 16), 1e-10, "cap on C8 at the C-H bond length");
    tester.assert_true(fragment.Graph().HasBond(2, 15) && fragment.Graph().HasBond(5, 16), "caps bonded to their parents");

    Position along = (complex.getPosition(3) - complex.getPosition(2)).normalized();
    Position cap = (fragment.getPosition(15) - fragment.getPosition(2)).normalized();
    tester.assert_equal(1.0, along.dot(cap), 1e-10, "cap points along the cut bond");

    FragmentStripper uncapped(json{ { "cap_hydrogens", false } });
    StripResult bare = uncapped.Strip(complex, Depth2Core(), fixtures::SN2Rearrangement());
    tester.assert_equal(15, bare.structure.AtomCount(), 1e-10, "core atoms only without capping");
    tester.assert_equal(0, bare.capping_atoms, 1e-10, "no caps counted");

    auto diagnostics = std::make_shared<RecordingDiagnostics>();
    FragmentStripper reporting(json::object(), diagnostics);
    reporting.Strip(complex, Depth2Core(), fixtures::SN2Rearrangement());
    tester.assert_equal(1, diagnostics->infos.size(), 1e-10, "stripping reported to the given diagnostics");

    // the stripper shares ownership of a temporary diagnostics object
    FragmentStripper owning(json::object(), std::make_shared<RecordingDiagnostics>());
    StripResult owned = owning.Strip(complex, Depth2Core(), fixtures::SN2Rearrangement());
    tester.assert_equal(17, owned.structure.AtomCount(), 1e-10, "strip with owned diagnostics");
}

void test_no_dangling_pairs(SaddleTest& tester)
{
    std::cout << "\n=== Testing Dropped References ===" << std::endl;

    Structure complex = fixtures::ReactantComplex();
    complex.setActiveAtoms({ 0, 1, 30, 9 });
    complex.setPiBonds({ { 2, 3 }, { 7, 8 } });

    BondRearrangement rearrangement({ { 1, 30 }, { 9, 31 } }, { { 0, 1 }, { 2, 3 } });
    FragmentStripper stripper;
    StripResult result = stripper.Strip(complex, Depth2Core(), rearrangement);

    const int atoms = static_cast<int>(result.structure.AtomCount());
    auto inside = [atoms](const std::vector<IntPair>& pairs) {
        for (const auto& pair : pairs)
            if (pair.first < 0 || pair.second < 0 || pair.first >= atoms || pair.second >= atoms)
                return false;
        return true;
    };
    tester.assert_true(inside(result.bond_rearrangement.FormingBonds()) && inside(result.bond_rearrangement.BreakingBonds()), "all pairs inside the fragment");
    tester.assert_equal(1, result.bond_rearrangement.FormingCount(), 1e-10, "forming bond to a removed atom dropped");
    tester.assert_equal(1, result.bond_rearrangement.BreakingCount(), 1e-10, "breaking bond to a removed atom dropped");

    tester.assert_true(result.structure.PiBonds() == std::vector<IntPair>({ { 4, 5 } }), "pi bonds remapped");
    tester.assert_true(result.structure.ActiveAtoms() == std::vector<int>({ 0, 1, 13 }), "active atoms remapped");

    auto remapped = RemapPairs({ { 0, 2 }, { 3, 4 } }, { 0, -1, 1, 2, -1 });
    tester.assert_true(remapped == std::vector<IntPair>({ { 0, 1 } }), "pairs through the index map");
}

void test_no_op(SaddleTest& tester)
{
    std::cout << "\n=== Testing Full Core and Missing Core ===" << std::endl;

    Structure complex = fixtures::ReactantComplex();
    BondRearrangement rearrangement = fixtures::SN2Rearrangement();
    FragmentStripper stripper;

    std::set<int> everything;
    for (int i = 0; i < 32; ++i)
        everything.insert(i);

    StripResult full = stripper.Strip(complex, everything, rearrangement);
    tester.assert_true(!full.stripped, "full core is not stripped");
    tester.assert_true(full.structure == complex, "structure unchanged");
    tester.assert_true(full.structure.Name() == complex.Name() && !full.structure.IsFragment(), "name and fragment flag unchanged");
    tester.assert_true(full.bond_rearrangement == rearrangement, "rearrangement unchanged");
    tester.assert_equal(31, full.NewIndex(31), 1e-10, "identity map");

    StripResult none = stripper.Strip(complex, std::nullopt, rearrangement);
    tester.assert_true(!none.stripped && none.structure == complex, "missing core is a no-op");

    Structure copy = complex;
    stripper.Strip(complex, Depth2Core(), rearrangement);
    tester.assert_true(complex == copy && complex.Name() == copy.Name(), "input structure unchanged after stripping");
}

void test_invalid_input(SaddleTest& tester)
{
    std::cout << "\n=== Testing Invalid Input ===" << std::endl;

    Structure complex = fixtures::ReactantComplex();
    FragmentStripper stripper;
    tester.assert_throws<InputError>([&]() { stripper.Strip(complex, Depth2Core(), BondRearrangement({ { 1, 40 } }, {})); }, "rearrangement outside the structure");
    tester.assert_throws<InputError>([&]() { stripper.Strip(complex, std::set<int>({ 0, 1, 50 }), fixtures::SN2Rearrangement()); }, "core atom outside the structure");
}

void test_selection_pipeline(SaddleTest& tester)
{
    std::cout << "\n=== Testing Selection and Stripping ===" << std::endl;

    Structure complex = fixtures::ReactantComplex();
    BondRearrangement rearrangement = fixtures::SN2Rearrangement();
    complex.setActiveAtoms(rearrangement.ActiveAtoms());

    CoreAtomSelector selector(json{ { "depth", 2 } });
    FragmentStripper stripper;
    StripResult result = stripper.Strip(complex, selector.Select(complex), rearrangement);
    tester.assert_equal(17, result.structure.AtomCount(), 1e-10, "selected and capped fragment");
    tester.assert_true(result.bond_rearrangement.FormingBonds().front() == IntPair(1, 13), "forming bond in the fragment");
}

int main()
{
    SaddleLogger::initialize(0, true);

    std::cout << "=== Fragment Stripping Test Suite ===" << std::endl;

    SaddleTest tester;
    test_strip_sn2_core(tester);
    test_order_preservation(tester);
    test_capping_hydrogens(tester);
    test_no_dangling_pairs(tester);
    test_no_op(tester);
    test_invalid_input(tester);
    test_selection_pipeline(tester);

    std::cout << "\n=== Test Summary ===" << std::endl;
    tester.print_summary();
    return tester.exit_code();
}
