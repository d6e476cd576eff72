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

#include "io/hdf5/HDF5Writer.hpp"
#include "io/IOException.hpp"
#include "common/JsonParameterProvider.hpp"

#include <tclap/CmdLine.h>
#include "common/TclapUtils.hpp"
#include "griddae/LibVersionInfo.hpp"

#include "griddae/Logging.hpp"
#include "griddae/Exceptions.hpp"

#include "PowerGrid.hpp"
#include "ModelFactory.hpp"
#include "NetworkDynamics.hpp"
#include "OperationPoint.hpp"
#include "State.hpp"
#include "Stability.hpp"
#include "TimeIntegrator.hpp"

#include <iostream>
#include <iomanip>
#include <limits>
#include <memory>

class LogReceiver : public griddae::ILogReceiver
{
public:
	LogReceiver() { }

	virtual void message(const char* file, const char* func, const unsigned int line, griddae::LogLevel lvl, const char* lvlStr, const char* message)
	{
		std::cout << '[' << lvlStr << ": " << func << "::" << line << "] " << message << std::flush;
	}
};

// Command line parsing support for griddae::LogLevel type
namespace TCLAP 
{
	template<>
	struct ArgTraits<griddae::LogLevel>
	{
		typedef StringLike ValueCategory;
	};

	template<>
	void SetString<griddae::LogLevel>(griddae::LogLevel& v, const std::string& s)
	{
		if (!griddae::parseLogLevel(s, v))
			throw TCLAP::ArgParseException("Couldn't convert '" + s + "' to a valid log level");
	}
} // namespace TCLAP


struct ProgramOptions
{
	std::string inFileName;
	std::string outFileName;
	bool sparse;
	bool integrate;
	double endTime;
};

struct AnalysisResult
{
	std::vector<std::string> variableNames;
	std::vector<double> operatingPoint;
	std::vector<double> eigenvalues;
	griddae::EigenvalueExtrema extrema;
	griddae::Trajectory trajectory;
	bool hasTrajectory;
};

AnalysisResult analyze(griddae::JsonParameterProvider& pp, const ProgramOptions& opts)
{
	AnalysisResult result;
	result.hasTrajectory = false;

	const griddae::ModelFactory factory;
	griddae::PowerGrid grid;

	pp.pushScope("grid");
	grid.configure(pp, factory);
	pp.popScope();

	const griddae::NetworkDynamics field(grid);
	result.variableNames = field.variableNames();

	// Operating point
	double tol = griddae::defaultOperationPointTolerance;
	bool sparse = opts.sparse;
	const bool hasSolverScope = pp.exists("solver");
	if (hasSolverScope)
	{
		pp.pushScope("solver");
		if (pp.exists("TOLERANCE"))
			tol = pp.getDouble("TOLERANCE");
		if (pp.exists("SPARSE"))
			sparse = sparse || pp.getBool("SPARSE");
	}

	griddae::IParameterProvider* const solverConfig = hasSolverScope ? &pp : nullptr;
	const griddae::State op = sparse ? griddae::findOperationPointSparse(grid, nullptr, tol, solverConfig)
		: griddae::findOperationPoint(grid, nullptr, tol, solverConfig);

	if (hasSolverScope)
		pp.popScope();

	result.operatingPoint = op.vector();

	for (unsigned int i = 0; i < grid.numNodes(); ++i)
	{
		std::cout << "Node " << i << " (" << grid.node(i).name() << "): |u| = " << op.voltageMagnitude(i)
			<< ", angle = " << op.voltageAngle(i) << std::endl;
	}

	// Linear stability
	result.eigenvalues = griddae::eigenvalueRealParts(field, result.operatingPoint);
	result.extrema = griddae::checkEigenvalues(field, op);
	std::cout << "Eigenvalues: min " << result.extrema.min << ", max " << result.extrema.max
		<< (result.extrema.stable ? " (stable)" : " (unstable)") << std::endl;

	if (!opts.integrate)
		return result;

	// Trajectory after perturbation
	griddae::State start = op;
	if (pp.exists("perturbation"))
	{
		pp.pushScope("perturbation");
		start = op.withPerturbation(griddae::Perturbation::fromParameters(pp));
		pp.popScope();
	}

	griddae::TimeIntegrator integrator;
	if (pp.exists("integrator"))
	{
		pp.pushScope("integrator");
		integrator.configure(pp);
		pp.popScope();
	}

	result.trajectory = integrator.integrate(field, start.vector(), opts.endTime);
	result.hasTrajectory = true;
	std::cout << "Integrated " << result.trajectory.numTimePoints() << " time points until t = " << opts.endTime << std::endl;

	return result;
}

void writeResult(const std::string& fileName, const AnalysisResult& result)
{
	griddae::io::HDF5Writer writer;
	writer.openFile(fileName, "c");

	writer.pushGroup("output");
	writer.vector<std::string>("variable_names", result.variableNames);
	writer.vector<double>("operating_point", result.operatingPoint);
	writer.vector<double>("eigenvalues", result.eigenvalues);
	writer.scalar<int>("stable", result.extrema.stable ? 1 : 0);

	if (result.hasTrajectory)
	{
		writer.pushGroup("trajectory");
		writer.vector<double>("time", result.trajectory.time);
		writer.matrix<double>("state", result.trajectory.numTimePoints(), result.trajectory.numDofs, result.trajectory.states);
		writer.popGroup();
	}

	writer.popGroup();
	writer.closeFile();
}

int main(int argc, char** argv)
{
	ProgramOptions opts;
	opts.sparse = false;
	opts.integrate = false;
	opts.endTime = 10.0;
	griddae::LogLevel logLevel = griddae::LogLevel::Warning;

	try
	{
		TCLAP::CustomOutput customOut("griddae-cli");
		TCLAP::CmdLine cmd("Computes the operating point and stability of a power grid using GridDAE", ' ', griddae::getLibraryVersion());
		cmd.setOutput(&customOut);

		TCLAP::SwitchArg sparseArg("", "sparse", "Use sparse Jacobians for the operating point search", cmd, false);
		TCLAP::SwitchArg integrateArg("", "integrate", "Integrate the perturbed operating point", cmd, false);
		TCLAP::ValueArg<double> endTimeArg("t", "tend", "End time of the integration", false, 10.0, "Time", cmd);
		TCLAP::ValueArg<griddae::LogLevel> logLevelArg("L", "loglevel", "Set the log level", false, griddae::LogLevel::Warning, "LogLevel", cmd);
		TCLAP::UnlabeledValueArg<std::string> inputArg("input", "Input JSON file", true, "", "File", cmd);
		TCLAP::UnlabeledValueArg<std::string> outputArg("output", "Output HDF5 file", false, "", "File", cmd);

		cmd.parse(argc, argv);

		opts.sparse = sparseArg.getValue();
		opts.integrate = integrateArg.getValue();
		opts.endTime = endTimeArg.getValue();
		logLevel = logLevelArg.getValue();
		opts.inFileName = inputArg.getValue();
		opts.outFileName = outputArg.getValue();
	}
	catch (const TCLAP::ArgException &e)
	{
		std::cerr << "ERROR: " << e.error() << " for argument " << e.argId() << std::endl;
		return 1;
	}

	std::cout << std::scientific << std::setprecision(std::numeric_limits<double>::digits10 + 1);

	LogReceiver lr;
	griddae::setLogReceiver(&lr);
	griddae::setLogLevel(logLevel);

	try
	{
		griddae::JsonParameterProvider pp = griddae::JsonParameterProvider::fromFile(opts.inFileName);
		const AnalysisResult result = analyze(pp, opts);

		if (!opts.outFileName.empty())
			writeResult(opts.outFileName, result);
	}
	catch (const griddae::io::IOException& e)
	{
		std::cerr << "IO ERROR: " << e.what() << std::endl;
		return 2;
	}
	catch (const griddae::OperationPointError& e)
	{
		std::cerr << "SOLVER ERROR: " << e.what() << std::endl;
		return 3;
	}
	catch (const griddae::IntegrationException& e)
	{
		std::cerr << "SOLVER ERROR: " << e.what() << std::endl;
		return 3;
	}
	catch (const griddae::StabilityError& e)
	{
		std::cerr << "SOLVER ERROR: " << e.what() << std::endl;
		return 3;
	}
	catch (const std::exception& e)
	{
		std::cerr << "ERROR: " << e.what() << std::endl;
		return 1;
	}

	griddae::setLogReceiver(nullptr);
	return 0;
}
