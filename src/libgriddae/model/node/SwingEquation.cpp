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

#include <functional>
#include <unordered_map>
#include <string>

namespace griddae
{

namespace model
{

namespace
{
	char const* const swingNames[] = { "u_r", "u_i", "ω" };
	const bool swingDifferential[] = { true, true, true };
}

/**
 * @brief Swing equation of a synchronous machine
 * @details Parameters: mechanical power @f$ P @f$. Constants: inertia @f$ H @f$, damping @f$ D @f$,
 *          and rated frequency @f$ \Omega @f$.
 *          @f[ \begin{align} \dot{u} &= i u \omega, \\ \dot{\omega} &= (P - D \omega - \operatorname{Re}(u \bar{\imath})) \Omega_H \end{align} @f]
 *          The voltage magnitude is not damped, which leaves the operating point undetermined.
 */
class SwingEq : public NodeModelBase
{
public:
	SwingEq() : NodeModelBase(swingNames, swingDifferential, 3), _H(1.0), _P(0.0), _D(0.0), _Omega(50.0) { }
	virtual ~SwingEq() GRIDDAE_NOEXCEPT { }

	static const char* identifier() { return "SwingEq"; }
	virtual const char* name() const GRIDDAE_NOEXCEPT { return SwingEq::identifier(); }

	virtual bool configure(IParameterProvider& paramProvider)
	{
		_H = paramProvider.getDouble("H");
		_P = paramProvider.getDouble("P");
		_D = paramProvider.getDouble("D");
		_Omega = paramProvider.getDouble("OMEGA");
		return _H > 0.0;
	}

	virtual bool supportsOperationPoint() const GRIDDAE_NOEXCEPT { return false; }

	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT { return 1; }
	virtual void defaultParameters(double* p) const { p[0] = _P; }

	GRIDDAE_NODEMODEL_DYNAMICS_BOILERPLATE

protected:
	double _H;
	double _P;
	double _D;
	double _Omega;

	template <typename StateType, typename ParamType, typename ResultType>
	void dynamicsImpl(double t, StateType const* u, const util::Complex<StateType>& i, ParamType const* p, ResultType* du) const
	{
		const util::Complex<StateType> uc(u[0], u[1]);
		const util::Complex<StateType> duc = util::scale(util::timesI(uc), u[2]);
		const StateType pe = (uc * util::conj(i)).re;

		du[0] = duc.re;
		du[1] = duc.im;
		du[2] = (p[0] - _D * u[2] - pe) * inertiaScaling(_Omega, _H);
	}
};

/**
 * @brief Swing equation with voltage-dependent damping towards the magnitude @f$ V @f$
 * @details Adds @f$ -\frac{u}{|u|} \Gamma (|u| - V) @f$ to the voltage derivative of SwingEq.
 */
class SwingEqLVS : public SwingEq
{
public:
	SwingEqLVS() : SwingEq(), _Gamma(1.0), _V(1.0) { }
	virtual ~SwingEqLVS() GRIDDAE_NOEXCEPT { }

	static const char* identifier() { return "SwingEqLVS"; }
	virtual const char* name() const GRIDDAE_NOEXCEPT { return SwingEqLVS::identifier(); }

	virtual bool configure(IParameterProvider& paramProvider)
	{
		if (!SwingEq::configure(paramProvider))
			return false;

		_Gamma = paramProvider.getDouble("GAMMA");
		_V = paramProvider.getDouble("V");
		return _V > 0.0;
	}

	virtual bool supportsOperationPoint() const GRIDDAE_NOEXCEPT { return true; }

	GRIDDAE_NODEMODEL_DYNAMICS_BOILERPLATE

protected:
	double _Gamma;
	double _V;

	template <typename StateType, typename ParamType, typename ResultType>
	void dynamicsImpl(double t, StateType const* u, const util::Complex<StateType>& i, ParamType const* p, ResultType* du) const
	{
		SwingEq::dynamicsImpl<StateType, ParamType, ResultType>(t, u, i, p, du);

		const util::Complex<StateType> uc(u[0], u[1]);
		const StateType v = util::abs(uc);
		const StateType factor = _Gamma * (v - _V) / v;

		du[0] -= u[0] * factor;
		du[1] -= u[1] * factor;
	}
};

namespace node
{
	void registerSwingEquations(std::unordered_map<std::string, std::function<model::INodeModel*()>>& nodes)
	{
		nodes[SwingEq::identifier()] = []() { return new SwingEq(); };
		nodes[SwingEqLVS::identifier()] = []() { return new SwingEqLVS(); };
	}
}  // namespace node

} // namespace model

} // namespace griddae
