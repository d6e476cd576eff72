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

#include "OperationPoint.hpp"
#include "PowerGrid.hpp"
#include "ModelFactory.hpp"
#include "NetworkDynamics.hpp"
#include "Jacobian.hpp"
#include "model/NodeModel.hpp"
#include "nonlin/Solver.hpp"
#include "nonlin/AdaptiveTrustRegionNewton.hpp"
#include "linalg/DenseMatrix.hpp"
#include "linalg/EigenSolverWrapper.hpp"
#include "linalg/PseudoInverse.hpp"
#include "linalg/Norms.hpp"
#include "griddae/Exceptions.hpp"
#include "griddae/ParameterProvider.hpp"
#include "Logging.hpp"
#include "LoggingUtils.hpp"

#include <memory>
#include <string>
#include <Eigen/Dense>

namespace
{
	const char* const failureMessage = "Failed to find initial conditions on the constraint manifold!";

	typedef Eigen::Map<Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>> RowMajorMap;

	double readResidualTolerance(griddae::IParameterProvider* config)
	{
		if (config && config->exists("RESIDUAL_TOLERANCE"))
			return config->getDouble("RESIDUAL_TOLERANCE");
		return 1e-6;
	}

	void checkOperationPointSupport(const griddae::PowerGrid& grid)
	{
		if (grid.slackIndex() < 0)
			LOG(Warning) << "Grid has no SlackAlgebraic node, power flow may be unbalanced";

		for (unsigned int i = 0; i < grid.numNodes(); ++i)
		{
			const griddae::model::INodeModel& node = grid.node(i);
			if (node.supportsOperationPoint())
				continue;

			if (std::string(node.name()) == "SwingEq")
				throw griddae::UnsupportedNodeTypeError("Found SwingEq node " + std::to_string(i) + " but these should be SwingEqLVS (SwingEq is not supported for operation point search)");

			throw griddae::UnsupportedNodeTypeError("Node " + std::to_string(i) + " of type " + node.name() + " is not supported for operation point search");
		}
	}

	std::vector<double> startingPoint(const griddae::PowerGrid& grid, std::vector<double> const* guess, double fill)
	{
		if (!guess)
			return std::vector<double>(grid.numDofs(), fill);

		if (guess->size() != grid.numDofs())
			throw griddae::DimensionError("Initial guess has " + std::to_string(guess->size()) + " elements, grid requires " + std::to_string(grid.numDofs()));

		return *guess;
	}

	/**
	 * @brief Runs a nonlinear solver with dense Jacobians and validates the result
	 */
	bool solveDense(std::function<bool(double const* const, double* const)> residual, std::function<bool(double const* const, griddae::linalg::detail::DenseMatrixBase& jac)> jacobian,
		double tol, griddae::IParameterProvider* config, std::vector<double>& point)
	{
		const unsigned int n = point.size();
		const std::string solverName = (config && config->exists("NONLIN_SOLVER")) ? config->getString("NONLIN_SOLVER") : std::string();

		std::unique_ptr<griddae::nonlin::Solver> solver(griddae::nonlin::createSolver(solverName));
		if (config && !solver->configure(*config))
			throw griddae::InvalidParameterException(std::string("Invalid configuration of nonlinear solver ") + solver->name());

		LOG(Debug) << "Solving " << n << " equations with " << solver->name();

		griddae::linalg::DenseMatrix jacMatrix;
		jacMatrix.resize(n, n);
		std::vector<double> workspace(solver->workspaceSize(n), 0.0);

		if (!solver->solve(residual, jacobian, tol, point.data(), workspace.data(), jacMatrix, n))
			return false;

		// Finish with a full Newton step so that linear constraints (slack voltages) hold exactly
		const std::string usedSolver = solver->name();
		if ((usedSolver != griddae::nonlin::RobustAdaptiveTrustRegionNewtonSolver::identifier()) && (usedSolver != griddae::nonlin::AdaptiveTrustRegionNewtonSolver::identifier()))
		{
			const griddae::nonlin::RobustAdaptiveTrustRegionNewtonSolver newton;
			std::vector<double> polished = point;
			std::vector<double> newtonWorkspace(newton.workspaceSize(n), 0.0);
			if (newton.solve(residual, jacobian, tol, polished.data(), newtonWorkspace.data(), jacMatrix, n))
				point = polished;
			else
				LOG(Debug) << "Newton polishing after " << usedSolver << " did not converge, keeping solution";
		}

		std::vector<double> res(n, 0.0);
		if (!residual(point.data(), res.data()))
			return false;

		const double resNorm = griddae::linalg::linfNorm(res.data(), n);
		LOG(Debug) << "Residual norm of solution " << resNorm;

		return resNorm <= readResidualTolerance(config);
	}
}

namespace griddae
{

std::vector<double> initialGuess(const PowerGrid& grid, const ModelFactory& factory)
{
	double uRe = 1.0;
	double uIm = 0.0;

	const int slack = grid.slackIndex();
	if (slack < 0)
		LOG(Warning) << "Grid has no SlackAlgebraic node, using 1 + 0i as reference voltage";
	else
		grid.node(slack).referenceVoltage(uRe, uIm);

	std::vector<double> guess(grid.numDofs(), 0.0);
	for (unsigned int i = 0; i < grid.numNodes(); ++i)
	{
		const model::INodeModel& node = grid.node(i);
		factory.guessFunction(node.name())(node, uRe, uIm, guess.data() + grid.offset(i));
	}

	return guess;
}

std::vector<double> initialGuess(const PowerGrid& grid)
{
	const ModelFactory factory;
	return initialGuess(grid, factory);
}

State findOperationPoint(const PowerGrid& grid, std::vector<double> const* guess, double tol, IParameterProvider* config)
{
	checkOperationPointSupport(grid);

	std::vector<double> point = guess ? startingPoint(grid, guess, 0.0) : initialGuess(grid);

	const NetworkDynamics field(grid);
	const bool success = solveDense(
		[&](double const* const x, double* const res) -> bool
		{
			field.evaluate(0.0, x, nullptr, res);
			return true;
		},
		[&](double const* const x, linalg::detail::DenseMatrixBase& jac) -> bool
		{
			denseJacobian(field, 0.0, x, nullptr, jac);
			return true;
		}, tol, config, point);

	if (!success)
		throw OperationPointError(failureMessage);

	LOG(Debug) << "Operation point " << log::VectorPtr<double>(point.data(), point.size());
	return State(grid, std::move(point));
}

State findOperationPointSparse(const PowerGrid& grid, std::vector<double> const* guess, double tol, IParameterProvider* config)
{
	checkOperationPointSupport(grid);

	std::vector<double> point = startingPoint(grid, guess, 1.0);
	const unsigned int n = point.size();

	unsigned int maxIter = 50;
	double initDamping = 1e-2;
	double minDamping = 1e-4;
	std::string linSolverName = "SparseLU";
	if (config)
	{
		if (config->exists("MAX_ITERATIONS"))
			maxIter = config->getInt("MAX_ITERATIONS");
		if (config->exists("INIT_DAMPING"))
			initDamping = config->getDouble("INIT_DAMPING");
		if (config->exists("MIN_DAMPING"))
			minDamping = config->getDouble("MIN_DAMPING");
		if (config->exists("LINEAR_SOLVER"))
			linSolverName = config->getString("LINEAR_SOLVER");
	}

	const NetworkDynamics field(grid);
	const ColoredJacobian coloredJac(field.sparsityPattern(), n);
	std::unique_ptr<linalg::EigenSolverBase> linSolver(linalg::createLinearSolver(linSolverName));
	Eigen::SparseMatrix<double> jac;

	double const* const defaultParams = nullptr;
	const ActiveFunction adField = [&](active const* x, active* res) { field.evaluate(0.0, x, defaultParams, res); };

	std::vector<double> workspace(4 * n, 0.0);
	const bool converged = nonlin::robustAdaptiveTrustRegionNewtonMethod(
		[&](double const* const x, double* const res) -> bool
		{
			field.evaluate(0.0, x, nullptr, res);
			return true;
		},
		[&](double const* const x, double* const rhs) -> bool
		{
			coloredJac.compute(adField, x, jac);
			if (!linSolver->factorize(jac))
				return false;

			Eigen::Map<Eigen::VectorXd> r(rhs, n);
			return linSolver->solve(r);
		},
		[&](double* const rhs) -> bool
		{
			Eigen::Map<Eigen::VectorXd> r(rhs, n);
			return linSolver->solve(r);
		}, maxIter, tol, initDamping, minDamping, point.data(), workspace.data(), n);

	if (!converged)
	{
		LOG(Debug) << "Sparse Newton method with " << linSolver->name() << " did not converge";
		throw OperationPointError(failureMessage);
	}

	std::vector<double> res(n, 0.0);
	field.evaluate(0.0, point.data(), nullptr, res.data());
	if (linalg::linfNorm(res.data(), n) > readResidualTolerance(config))
		throw OperationPointError(failureMessage);

	return State(grid, std::move(point));
}

State findOperationPoint(const PowerGrid& grid, IParameterProvider& config, std::vector<double> const* guess)
{
	const double tol = config.exists("TOLERANCE") ? config.getDouble("TOLERANCE") : defaultOperationPointTolerance;
	const bool sparse = config.exists("SPARSE") ? config.getBool("SPARSE") : false;

	if (sparse)
		return findOperationPointSparse(grid, guess, tol, &config);

	return findOperationPoint(grid, guess, tol, &config);
}

std::vector<double> findValidInitialCondition(const PowerGrid& grid, const std::vector<double>& guess, double tol, IParameterProvider* config)
{
	std::vector<double> point = startingPoint(grid, &guess, 0.0);
	const unsigned int n = point.size();

	const NetworkDynamics field(grid);
	const Eigen::MatrixXd projector = linalg::massProjector(field.massMatrix());

	const bool success = solveDense(
		[&](double const* const x, double* const res) -> bool
		{
			Eigen::Map<Eigen::VectorXd> r(res, n);
			field.evaluate(0.0, x, nullptr, res);
			r = (projector * r - r).eval();
			return true;
		},
		[&](double const* const x, linalg::detail::DenseMatrixBase& jac) -> bool
		{
			denseJacobian(field, 0.0, x, nullptr, jac);
			RowMajorMap j(jac.data(), n, n);
			j = (projector * j - j).eval();
			return true;
		}, tol, config, point);

	if (!success)
		throw OperationPointError(failureMessage);

	return point;
}

} // namespace griddae
