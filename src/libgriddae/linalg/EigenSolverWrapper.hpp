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

/**
 * @file 
 * Uniform interface for the sparse linear solvers of Eigen used by the sparse operating point search.
 */

#ifndef LIBGRIDDAE_EIGENSOLVERWRAPPER_HPP_
#define LIBGRIDDAE_EIGENSOLVERWRAPPER_HPP_

#include <Eigen/Sparse>
#include <string>

namespace griddae
{

namespace linalg
{

class EigenSolverBase
{
public:
	virtual ~EigenSolverBase() = default;

	virtual const char* name() const = 0;

	/**
	 * @brief Computes the factorization of the given matrix
	 * @details The pattern is analyzed on the first call and whenever the number of nonzeros changes.
	 * @param [in] mat Matrix in compressed storage
	 * @return @c true if the factorization succeeded, otherwise @c false
	 */
	virtual bool factorize(const Eigen::SparseMatrix<double>& mat) = 0;

	/**
	 * @brief Solves the linear system in-place using the previously computed factorization
	 * @param [in,out] rhs On entry right hand side, on exit solution
	 * @return @c true if the system was solved, otherwise @c false
	 */
	virtual bool solve(Eigen::Ref<Eigen::VectorXd> rhs) = 0;
};

template <typename OrderingType> class SparseLU : public EigenSolverBase
{
public:
	SparseLU() : _nnz(-1) { }

	const char* name() const override { return "SparseLU"; }

	bool factorize(const Eigen::SparseMatrix<double>& mat) override
	{
		if (_nnz != mat.nonZeros())
		{
			_solver.analyzePattern(mat);
			_nnz = mat.nonZeros();
		}
		_solver.factorize(mat);
		return _solver.info() == Eigen::Success;
	}

	bool solve(Eigen::Ref<Eigen::VectorXd> rhs) override
	{
		const Eigen::VectorXd sol = _solver.solve(rhs);
		if ((_solver.info() != Eigen::Success) || !sol.allFinite())
			return false;

		rhs = sol;
		return true;
	}

private:
	Eigen::SparseLU<Eigen::SparseMatrix<double>, OrderingType> _solver;
	Eigen::Index _nnz;
};

template <typename OrderingType> class SparseQR : public EigenSolverBase
{
public:
	const char* name() const override { return "SparseQR"; }

	bool factorize(const Eigen::SparseMatrix<double>& mat) override
	{
		_solver.compute(mat);
		return _solver.info() == Eigen::Success;
	}

	bool solve(Eigen::Ref<Eigen::VectorXd> rhs) override
	{
		const Eigen::VectorXd sol = _solver.solve(rhs);
		if ((_solver.info() != Eigen::Success) || !sol.allFinite())
			return false;

		rhs = sol;
		return true;
	}

private:
	Eigen::SparseQR<Eigen::SparseMatrix<double>, OrderingType> _solver;
};

template <typename PreConditioner> class BiCGSTAB : public EigenSolverBase
{
public:
	const char* name() const override { return "BiCGSTAB"; }

	bool factorize(const Eigen::SparseMatrix<double>& mat) override
	{
		_solver.compute(mat);
		return _solver.info() == Eigen::Success;
	}

	bool solve(Eigen::Ref<Eigen::VectorXd> rhs) override
	{
		const Eigen::VectorXd sol = _solver.solve(rhs);
		if ((_solver.info() != Eigen::Success) || !sol.allFinite())
			return false;

		rhs = sol;
		return true;
	}

private:
	Eigen::BiCGSTAB<Eigen::SparseMatrix<double>, PreConditioner> _solver;
};

/**
 * @brief Creates a sparse linear solver from its name
 * @details Valid names start with @c SparseLU, @c SparseQR, or @c BiCGSTAB and may name an
 *          ordering or preconditioner (e.g., @c SparseLU_NaturalOrdering).
 * @param [in] solverName Name of the solver
 * @return Solver owned by the caller
 * @throws InvalidParameterException if the name is unknown
 */
EigenSolverBase* createLinearSolver(const std::string& solverName);

} // namespace linalg

} // namespace griddae

#endif // LIBGRIDDAE_EIGENSOLVERWRAPPER_HPP_
