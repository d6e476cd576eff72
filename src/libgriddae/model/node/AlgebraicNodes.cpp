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

#include "model/node/NodeModelBase.hpp"
#include "griddae/ParameterProvider.hpp"
#include "griddae/Exceptions.hpp"

#include <functional>
#include <unordered_map>
#include <string>

namespace griddae
{

namespace model
{

namespace
{
	char const* const voltageNames[] = { "u_r", "u_i" };
	const bool algebraicVoltage[] = { false, false };
}

/**
 * @brief Slack (reference) node holding the voltage at a fixed value
 * @details Parameters: @f$ U = U_r + i U_i @f$. Residual form @f$ 0 = u - U @f$.
 */
class SlackAlgebraic : public NodeModelBase
{
public:
	SlackAlgebraic() : NodeModelBase(voltageNames, algebraicVoltage, 2), _uRe(1.0), _uIm(0.0) { }
	virtual ~SlackAlgebraic() GRIDDAE_NOEXCEPT { }

	static const char* identifier() { return "SlackAlgebraic"; }
	virtual const char* name() const GRIDDAE_NOEXCEPT { return SlackAlgebraic::identifier(); }

	virtual bool configure(IParameterProvider& paramProvider)
	{
		readComplexParameter(paramProvider, "U", _uRe, _uIm);
		return true;
	}

	virtual bool referenceVoltage(double& uRe, double& uIm) const GRIDDAE_NOEXCEPT
	{
		uRe = _uRe;
		uIm = _uIm;
		return true;
	}

	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT { return 2; }
	virtual void defaultParameters(double* p) const
	{
		p[0] = _uRe;
		p[1] = _uIm;
	}

	GRIDDAE_NODEMODEL_DYNAMICS_BOILERPLATE

protected:
	double _uRe;
	double _uIm;

	template <typename StateType, typename ParamType, typename ResultType>
	void dynamicsImpl(double t, StateType const* u, const util::Complex<StateType>& i, ParamType const* p, ResultType* du) const
	{
		du[0] = u[0] - p[0];
		du[1] = u[1] - p[1];
	}
};

/**
 * @brief Load (or generator) with prescribed complex power @f$ S = P + iQ @f$
 * @details Residual form @f$ 0 = S - u \bar{\imath} @f$.
 */
class PQAlgebraic : public NodeModelBase
{
public:
	PQAlgebraic() : NodeModelBase(voltageNames, algebraicVoltage, 2), _P(0.0), _Q(0.0) { }
	virtual ~PQAlgebraic() GRIDDAE_NOEXCEPT { }

	static const char* identifier() { return "PQAlgebraic"; }
	virtual const char* name() const GRIDDAE_NOEXCEPT { return PQAlgebraic::identifier(); }

	virtual bool configure(IParameterProvider& paramProvider)
	{
		_P = paramProvider.getDouble("P");
		_Q = paramProvider.getDouble("Q");
		return true;
	}

	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT { return 2; }
	virtual void defaultParameters(double* p) const
	{
		p[0] = _P;
		p[1] = _Q;
	}

	GRIDDAE_NODEMODEL_DYNAMICS_BOILERPLATE

protected:
	double _P;
	double _Q;

	template <typename StateType, typename ParamType, typename ResultType>
	void dynamicsImpl(double t, StateType const* u, const util::Complex<StateType>& i, ParamType const* p, ResultType* du) const
	{
		const util::Complex<StateType> s = util::Complex<StateType>(u[0], u[1]) * util::conj(i);
		du[0] = p[0] - s.re;
		du[1] = p[1] - s.im;
	}
};

/**
 * @brief Generator bus with prescribed active power @f$ P @f$ and voltage magnitude @f$ V @f$
 * @details Residual form @f$ 0 = (\operatorname{Re}(u \bar{\imath}) - P) + i (|u| - V) @f$.
 */
class PVAlgebraic : public NodeModelBase
{
public:
	PVAlgebraic() : NodeModelBase(voltageNames, algebraicVoltage, 2), _P(0.0), _V(1.0) { }
	virtual ~PVAlgebraic() GRIDDAE_NOEXCEPT { }

	static const char* identifier() { return "PVAlgebraic"; }
	virtual const char* name() const GRIDDAE_NOEXCEPT { return PVAlgebraic::identifier(); }

	virtual bool configure(IParameterProvider& paramProvider)
	{
		_P = paramProvider.getDouble("P");
		_V = paramProvider.getDouble("V");
		return _V > 0.0;
	}

	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT { return 2; }
	virtual void defaultParameters(double* p) const
	{
		p[0] = _P;
		p[1] = _V;
	}

	GRIDDAE_NODEMODEL_DYNAMICS_BOILERPLATE

protected:
	double _P;
	double _V;

	template <typename StateType, typename ParamType, typename ResultType>
	void dynamicsImpl(double t, StateType const* u, const util::Complex<StateType>& i, ParamType const* p, ResultType* du) const
	{
		const util::Complex<StateType> uc(u[0], u[1]);
		const util::Complex<StateType> s = uc * util::conj(i);
		du[0] = s.re - p[0];
		du[1] = util::abs(uc) - p[1];
	}
};

namespace node
{
	void registerAlgebraicNodes(std::unordered_map<std::string, std::function<model::INodeModel*()>>& nodes)
	{
		nodes[SlackAlgebraic::identifier()] = []() { return new SlackAlgebraic(); };
		nodes[PQAlgebraic::identifier()] = []() { return new PQAlgebraic(); };
		nodes[PVAlgebraic::identifier()] = []() { return new PVAlgebraic(); };
	}
}  // namespace node

} // namespace model

} // namespace griddae
