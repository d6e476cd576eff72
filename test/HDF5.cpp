// =============================================================================
//  GridDAE
//  
//  Copyright © 2023-present: The GridDAE Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

#include <catch.hpp>

#include "io/hdf5/HDF5Writer.hpp"
#include "io/hdf5/HDF5Reader.hpp"
#include "io/IOException.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace
{
	const char* const testFile = "griddae_test_output.h5";
}

TEST_CASE("HDF5 datasets are read back", "[HDF5],[IO]")
{
	{
		griddae::io::HDF5Writer writer;
		writer.openFile(testFile, "c");
		writer.pushGroup("output");

		writer.vector<std::string>("variable_names", {"u_r_0", "u_i_0", "ω_1"});
		writer.vector<double>("operating_point", {1.0, 0.0, 0.25});
		writer.scalar<int>("stable", 1);

		writer.pushGroup("trajectory");
		writer.matrix<double>("state", 2, 3, {1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
		writer.popGroup();

		writer.closeFile();
	}

	griddae::io::HDF5Reader reader;
	reader.openFile(testFile, "r");
	reader.pushGroup("output");

	CHECK(reader.exists("operating_point"));
	CHECK_FALSE(reader.exists("eigenvalues"));

	CHECK(reader.vector<std::string>("variable_names") == std::vector<std::string>({"u_r_0", "u_i_0", "ω_1"}));
	CHECK(reader.vector<double>("operating_point") == std::vector<double>({1.0, 0.0, 0.25}));
	CHECK(reader.scalar<int>("stable") == 1);

	reader.pushGroup("trajectory");
	CHECK(reader.tensorDimensions("state") == std::vector<std::size_t>({2, 3}));
	CHECK(reader.vector<double>("state") == std::vector<double>({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}));
	CHECK(reader.scalar<double>("state", 4) == 5.0);
	reader.popGroup();

	reader.closeFile();
	std::remove(testFile);
}

TEST_CASE("HDF5 datasets are replaced on rewrite", "[HDF5],[IO]")
{
	{
		griddae::io::HDF5Writer writer;
		writer.openFile(testFile, "c");
		writer.compressFields(true);
		writer.vector<double>("eigenvalues", {-1.0, -2.0});
		writer.closeFile();

		writer.openFile(testFile, "rw");
		writer.vector<double>("eigenvalues", {-3.0});
		writer.closeFile();
	}

	griddae::io::HDF5Reader reader;
	reader.openFile(testFile, "r");
	CHECK(reader.vector<double>("eigenvalues") == std::vector<double>(1, -3.0));
	reader.closeFile();
	std::remove(testFile);
}

TEST_CASE("HDF5 errors raise IOException", "[HDF5],[IO]")
{
	griddae::io::HDF5Reader reader;
	CHECK_THROWS_AS(reader.openFile("does_not_exist.h5", "r"), griddae::io::IOException);
	CHECK_THROWS_AS(reader.openFile(testFile, "x"), griddae::io::IOException);
	CHECK_FALSE(reader.isOpen());

	{
		griddae::io::HDF5Writer writer;
		writer.openFile(testFile, "c");
		writer.vector<int>("values", {1, 2});
	}

	reader.openFile(testFile, "r");
	CHECK_THROWS_AS(reader.vector<double>("missing"), griddae::io::IOException);

	reader.pushGroup("nothing");
	CHECK_THROWS_AS(reader.vector<int>("values"), griddae::io::IOException);
	reader.popGroup();

	CHECK(reader.vector<int>("values") == std::vector<int>({1, 2}));
	reader.closeFile();
	std::remove(testFile);
}
