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

#include "TimeIntegrator.hpp"
#include "VectorField.hpp"
#include "DaeResidual.hpp"
#include "linalg/DenseMatrix.hpp"
#include "linalg/Norms.hpp"
#include "griddae/Exceptions.hpp"
#include "griddae/ParameterProvider.hpp"
#include "Logging.hpp"
#include "LoggingUtils.hpp"

#include <idas/idas.h>
#include <nvector/nvector_serial.h>
#include <sunmatrix/sunmatrix_dense.h>
#include <sunlinsol/sunlinsol_dense.h>
#include <sundials/sundials_config.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace
{
	inline std::string getIDAReturnFlagName(int solverFlag)
	{
		char const* const retFlagName = IDAGetReturnFlagName(solverFlag);
		const std::string flagName = retFlagName;
		std::free(const_cast<char*>(retFlagName));

		return flagName;
	}

	void idasErrorHandler(int error_code, const char* module, const char* function, char* msg, void* eh_data)
	{
		std::ostringstream oss;
		oss << "In function '" << function << "' of module '" << module << "', error code '" << getIDAReturnFlagName(error_code) << "': " << msg;

		if (error_code < 0)
			LOG(Error) << oss.str();
		else
			LOG(Warning) << oss.str();
	}

	struct IdasUserData
	{
		const griddae::DaeResidual* residual;
		griddae::linalg::DenseMatrix jacobian;
		std::vector<double> mass;
		std::vector<double> massDot; //!< Mass matrix times time derivative
	};

	// IDAS solves M du - f = 0, algebraic rows do not see their derivative
	int residualDaeWrapper(double t, N_Vector y, N_Vector yDot, N_Vector res, void* userData)
	{
		IdasUserData* const data = static_cast<IdasUserData*>(userData);
		double const* const yd = NV_DATA_S(yDot);
		for (std::size_t i = 0; i < data->mass.size(); ++i)
			data->massDot[i] = data->mass[i] * yd[i];

		data->residual->residual(t, NV_DATA_S(y), data->massDot.data(), NV_DATA_S(res));

		double const* const r = NV_DATA_S(res);
		for (sunindextype i = 0; i < NV_LENGTH_S(res); ++i)
		{
			if (!std::isfinite(r[i]))
				return 1;
		}
		return 0;
	}

	int jacobianDaeWrapper(double t, double cj, N_Vector y, N_Vector yDot, N_Vector res, SUNMatrix jac, void* userData, N_Vector tmp1, N_Vector tmp2, N_Vector tmp3)
	{
		IdasUserData* const data = static_cast<IdasUserData*>(userData);
		data->residual->jacobian(t, NV_DATA_S(y), cj, data->jacobian);

		const unsigned int n = data->jacobian.rows();
		for (unsigned int r = 0; r < n; ++r)
		{
			for (unsigned int c = 0; c < n; ++c)
				SM_ELEMENT_D(jac, r, c) = data->jacobian.native(r, c);

			// -J + cj M instead of -J + cj I
			SM_ELEMENT_D(jac, r, r) -= cj * (1.0 - data->mass[r]);
		}
		return 0;
	}

	/**
	 * @brief Owns the IDAS memory block and its vectors for one integration run
	 */
	class IdasSession
	{
	public:
		IdasSession(const griddae::DaeResidual& residual, const std::vector<double>& massMatrix, const std::vector<double>& u0,
			double absTol, double relTol, int maxSteps) : _ctx(nullptr), _mem(nullptr), _y(nullptr), _yDot(nullptr), _id(nullptr), _mat(nullptr), _linSolver(nullptr)
		{
			const sunindextype n = u0.size();
			_data.residual = &residual;
			_data.jacobian.resize(n, n);
			_data.mass = massMatrix;
			_data.massDot.assign(n, 0.0);

#if SUNDIALS_VERSION_MAJOR >= 6
			SUNContext_Create(nullptr, &_ctx);
			_y = N_VNew_Serial(n, _ctx);
			_yDot = N_VNew_Serial(n, _ctx);
			_id = N_VNew_Serial(n, _ctx);
			_mat = SUNDenseMatrix(n, n, _ctx);
			_linSolver = SUNLinSol_Dense(_y, _mat, _ctx);
			_mem = IDACreate(_ctx);
#else
			_y = N_VNew_Serial(n);
			_yDot = N_VNew_Serial(n);
			_id = N_VNew_Serial(n);
			_mat = SUNDenseMatrix(n, n);
			_linSolver = SUNLinSol_Dense(_y, _mat);
			_mem = IDACreate();
#endif
			if (!_mem || !_y || !_yDot || !_id || !_mat || !_linSolver)
			{
				release();
				throw griddae::IntegrationException("Could not allocate IDAS memory");
			}

			// Consistent derivative for differential variables, zero for algebraic ones
			double* const y = NV_DATA_S(_y);
			double* const yDot = NV_DATA_S(_yDot);
			double* const id = NV_DATA_S(_id);
			std::copy(u0.begin(), u0.end(), y);
			std::fill(yDot, yDot + n, 0.0);
			residual.residual(0.0, y, yDot, yDot);
			for (sunindextype i = 0; i < n; ++i)
			{
				id[i] = (massMatrix[i] == 1.0) ? 1.0 : 0.0;
				yDot[i] = -yDot[i] * id[i];
			}

			IDASetErrHandlerFn(_mem, &idasErrorHandler, nullptr);
			check(IDAInit(_mem, &residualDaeWrapper, 0.0, _y, _yDot), "IDAInit");
			check(IDASStolerances(_mem, relTol, absTol), "IDASStolerances");
			check(IDASetUserData(_mem, &_data), "IDASetUserData");
			check(IDASetMaxNumSteps(_mem, maxSteps), "IDASetMaxNumSteps");
			check(IDASetLinearSolver(_mem, _linSolver, _mat), "IDASetLinearSolver");
			check(IDASetJacFn(_mem, &jacobianDaeWrapper), "IDASetJacFn");
			check(IDASetId(_mem, _id), "IDASetId");
		}

		~IdasSession() GRIDDAE_NOEXCEPT
		{
			release();
		}

		IdasSession(const IdasSession&) = delete;
		IdasSession& operator=(const IdasSession&) = delete;

		void computeConsistentInitialValues(double tFirst)
		{
			check(IDACalcIC(_mem, IDA_YA_YDP_INIT, tFirst), "IDACalcIC");
			check(IDAGetConsistentIC(_mem, _y, _yDot), "IDAGetConsistentIC");
		}

		double advance(double tOut, int task)
		{
			double tReached = 0.0;
			check(IDASolve(_mem, tOut, &tReached, _y, _yDot, task), "IDASolve");
			return tReached;
		}

		void setStopTime(double tStop)
		{
			check(IDASetStopTime(_mem, tStop), "IDASetStopTime");
		}

		inline double const* state() const { return NV_DATA_S(_y); }

	private:
#if SUNDIALS_VERSION_MAJOR >= 6
		SUNContext _ctx;
#else
		void* _ctx;
#endif
		void* _mem;
		N_Vector _y;
		N_Vector _yDot;
		N_Vector _id;
		SUNMatrix _mat;
		SUNLinearSolver _linSolver;
		IdasUserData _data;

		void check(int flag, const char* func)
		{
			if (flag >= 0)
				return;

			throw griddae::IntegrationException(std::string("Error in ") + func + ": " + getIDAReturnFlagName(flag));
		}

		void release() GRIDDAE_NOEXCEPT
		{
			if (_mem)
				IDAFree(&_mem);
			if (_linSolver)
				SUNLinSolFree(_linSolver);
			if (_mat)
				SUNMatDestroy(_mat);
			if (_id)
				N_VDestroy_Serial(_id);
			if (_yDot)
				N_VDestroy_Serial(_yDot);
			if (_y)
				N_VDestroy_Serial(_y);
#if SUNDIALS_VERSION_MAJOR >= 6
			if (_ctx)
				SUNContext_Free(&_ctx);
#endif
			_mem = nullptr;
			_linSolver = nullptr;
			_mat = nullptr;
			_id = nullptr;
			_yDot = nullptr;
			_y = nullptr;
			_ctx = nullptr;
		}
	};

	void checkInitialState(const griddae::IVectorField& field, const std::vector<double>& u0)
	{
		if (u0.size() != field.numDofs())
			throw griddae::DimensionError("Initial state has " + std::to_string(u0.size()) + " elements, expected " + std::to_string(field.numDofs()));
	}
}

namespace griddae
{

TimeIntegrator::TimeIntegrator() : _absTol(1e-8), _relTol(1e-6), _maxSteps(10000) { }

void TimeIntegrator::configure(IParameterProvider& paramProvider)
{
	if (paramProvider.exists("ABSTOL"))
		_absTol = paramProvider.getDouble("ABSTOL");
	if (paramProvider.exists("RELTOL"))
		_relTol = paramProvider.getDouble("RELTOL");
	if (paramProvider.exists("MAX_STEPS"))
		_maxSteps = paramProvider.getInt("MAX_STEPS");
	if (paramProvider.exists("SOLUTION_TIMES"))
		setSolutionTimes(paramProvider.getDoubleArray("SOLUTION_TIMES"));

	if ((_absTol <= 0.0) || (_relTol <= 0.0))
		throw InvalidParameterException("Tolerances ABSTOL and RELTOL have to be positive");
	if (_maxSteps <= 0)
		throw InvalidParameterException("MAX_STEPS has to be positive");
}

void TimeIntegrator::setSolutionTimes(const std::vector<double>& times)
{
	for (std::size_t i = 0; i < times.size(); ++i)
	{
		if (times[i] < 0.0)
			throw InvalidParameterException("SOLUTION_TIMES have to be non-negative");
		if ((i > 0) && (times[i] <= times[i-1]))
			throw InvalidParameterException("SOLUTION_TIMES have to be strictly increasing");
	}

	_solutionTimes = times;
}

Trajectory TimeIntegrator::integrate(const IVectorField& field, const std::vector<double>& u0, double tEnd, std::vector<double> const* p) const
{
	checkInitialState(field, u0);
	if (tEnd <= 0.0)
		throw InvalidParameterException("End time has to be positive");

	std::vector<double> outTimes;
	if (_solutionTimes.empty())
	{
		const unsigned int nPoints = 101;
		for (unsigned int i = 0; i < nPoints; ++i)
			outTimes.push_back(tEnd * static_cast<double>(i) / static_cast<double>(nPoints - 1));
	}
	else
	{
		std::copy_if(_solutionTimes.begin(), _solutionTimes.end(), std::back_inserter(outTimes), [=](double t) { return t <= tEnd; });
		if (outTimes.empty() || (outTimes.back() < tEnd))
			outTimes.push_back(tEnd);
	}

	const DaeResidual residual = p ? DaeResidual(field, *p) : DaeResidual(field);
	IdasSession session(residual, field.massMatrix(), u0, _absTol, _relTol, _maxSteps);
	session.setStopTime(tEnd);

	const unsigned int n = u0.size();
	Trajectory traj;
	traj.numDofs = n;
	traj.time.reserve(outTimes.size());
	traj.states.reserve(outTimes.size() * n);

	std::size_t idxOut = 0;
	if (outTimes[0] == 0.0)
	{
		traj.time.push_back(0.0);
		traj.states.insert(traj.states.end(), u0.begin(), u0.end());
		++idxOut;
	}

	if (idxOut >= outTimes.size())
		return traj;

	session.computeConsistentInitialValues(outTimes[idxOut]);

	LOG(Debug) << "Integrating " << n << " DOFs to t = " << tEnd << " with " << outTimes.size() << " output times";

	for (; idxOut < outTimes.size(); ++idxOut)
	{
		const double t = session.advance(outTimes[idxOut], IDA_NORMAL);
		traj.time.push_back(t);
		traj.states.insert(traj.states.end(), session.state(), session.state() + n);
	}

	return traj;
}

std::vector<double> TimeIntegrator::steadyState(const IVectorField& field, const std::vector<double>& u0, double tMax, double tol) const
{
	checkInitialState(field, u0);

	const unsigned int n = u0.size();
	std::vector<double> f(n, 0.0);

	field.evaluate(0.0, u0.data(), nullptr, f.data());
	if (linalg::linfNorm(f.data(), n) <= tol)
		return u0;

	const DaeResidual residual(field);
	IdasSession session(residual, field.massMatrix(), u0, _absTol, _relTol, _maxSteps);
	session.setStopTime(tMax);
	session.computeConsistentInitialValues(std::min(tMax, 1e-3));

	double t = 0.0;
	while (t < tMax)
	{
		t = session.advance(tMax, IDA_ONE_STEP);

		field.evaluate(t, session.state(), nullptr, f.data());
		const double fNorm = linalg::linfNorm(f.data(), n);
		if (fNorm <= tol)
		{
			LOG(Debug) << "Reached steady state at t = " << t << " with derivative norm " << fNorm;
			return std::vector<double>(session.state(), session.state() + n);
		}
	}

	throw IntegrationException("No steady state reached until t = " + std::to_string(tMax));
}

std::vector<double> findSteadyState(const IVectorField& field, const std::vector<double>& u0, double tMax, double tol)
{
	const TimeIntegrator integrator;
	return integrator.steadyState(field, u0, tMax, tol);
}

} // namespace griddae
