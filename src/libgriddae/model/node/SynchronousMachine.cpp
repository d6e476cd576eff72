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
	char const* const machineNames[] = { "u_r", "u_i", "θ", "ω" };
	const bool machineDifferential[] = { true, true, true, true };
}

/**
 * @brief Flux decay (one-axis) model of a synchronous machine
 * @details The machine is described in the rotating @f$ dq @f$ frame, i.e.,
 *          @f$ e_d + i e_q = i u e^{-i\theta} @f$ and @f$ i_d + i i_q = i \imath e^{-i\theta} @f$.
 *          @f[ \begin{align} 
 *              \dot{\theta} &= \omega, \\
 *              \dot{e}_q &= \frac{1}{T_d'} \left( -e_q - (X_d - X_d') i_d + E_f \right), \\
 *              \dot{u} &= -i \, i \dot{e}_q e^{i\theta} + i u \omega, \\
 *              \dot{\omega} &= \left( P - D\omega - \operatorname{Re}(u \bar{\imath}) - (X_q - X_d') i_d i_q \right) \Omega_H
 *          \end{align} @f]
 *          Parameters: mechanical power @f$ P @f$.
 */
class ThirdOrderEq : public NodeModelBase
{
public:
	ThirdOrderEq() : NodeModelBase(machineNames, machineDifferential, 4), _H(1.0), _P(0.0), _D(0.0), _Omega(50.0),
		_Ef(1.0), _TdDash(1.0), _Xd(1.0), _XdDash(0.1), _Xq(1.0) { }
	virtual ~ThirdOrderEq() GRIDDAE_NOEXCEPT { }

	static const char* identifier() { return "ThirdOrderEq"; }
	virtual const char* name() const GRIDDAE_NOEXCEPT { return ThirdOrderEq::identifier(); }

	virtual bool configure(IParameterProvider& paramProvider)
	{
		_H = paramProvider.getDouble("H");
		_P = paramProvider.getDouble("P");
		_D = paramProvider.getDouble("D");
		_Omega = paramProvider.getDouble("OMEGA");
		_Ef = paramProvider.getDouble("E_F");
		_TdDash = paramProvider.getDouble("T_D_DASH");
		_Xd = paramProvider.getDouble("X_D");
		_XdDash = paramProvider.getDouble("X_D_DASH");
		_Xq = paramProvider.getDouble("X_Q");
		return (_H > 0.0) && (_TdDash > 0.0);
	}

	virtual unsigned int numParameters() const GRIDDAE_NOEXCEPT { return 1; }
	virtual void defaultParameters(double* p) const { p[0] = _P; }

	GRIDDAE_NODEMODEL_DYNAMICS_BOILERPLATE

protected:
	double _H;
	double _P;
	double _D;
	double _Omega;
	double _Ef;
	double _TdDash;
	double _Xd;
	double _XdDash;
	double _Xq;

	/**
	 * @brief Evaluates the machine equations for a given d-axis transient and q-axis coupling reactance
	 * @param [in] tqDash d-axis time constant @f$ T_q' @f$ or @c 0 for a constant @f$ e_d @f$
	 * @param [in] xqTransient Transient q-axis reactance entering @f$ \dot{e}_d @f$
	 * @param [in] xqCoupling q-axis reactance in the torque coupling term
	 */
	template <typename StateType, typename ParamType, typename ResultType>
	void machineDynamics(StateType const* u, const util::Complex<StateType>& i, ParamType const* p, ResultType* du,
		double tqDash, double xqTransient, double xqCoupling) const
	{
		const util::Complex<StateType> uc(u[0], u[1]);
		const util::Complex<StateType> rot = util::conj(util::expI(u[2]));

		const util::Complex<StateType> ec = util::timesI(uc) * rot;
		const util::Complex<StateType> ic = util::timesI(i) * rot;

		StateType deD = 0.0;
		if (tqDash > 0.0)
			deD = (-ec.re + (_Xq - xqTransient) * ic.im) / tqDash;

		const StateType deQ = (-ec.im - (_Xd - _XdDash) * ic.re + _Ef) / _TdDash;

		const util::Complex<StateType> duc = -(util::timesI(util::Complex<StateType>(deD, deQ)) * util::expI(u[2])) + util::scale(util::timesI(uc), u[3]);
		const StateType pe = (uc * util::conj(i)).re;

		du[0] = duc.re;
		du[1] = duc.im;
		du[2] = u[3];
		du[3] = (p[0] - _D * u[3] - pe - (xqCoupling - _XdDash) * ic.re * ic.im) * inertiaScaling(_Omega, _H);
	}

	template <typename StateType, typename ParamType, typename ResultType>
	void dynamicsImpl(double t, StateType const* u, const util::Complex<StateType>& i, ParamType const* p, ResultType* du) const
	{
		machineDynamics<StateType, ParamType, ResultType>(u, i, p, du, 0.0, _Xq, _Xq);
	}
};

/**
 * @brief Two-axis model of a synchronous machine
 * @details Extends ThirdOrderEq by the d-axis transient
 *          @f$ \dot{e}_d = \frac{1}{T_q'} \left( -e_d + (X_q - X_q') i_q \right) @f$
 *          and uses @f$ (X_q' - X_d') i_d i_q @f$ as coupling term.
 */
class FourthOrderEq : public ThirdOrderEq
{
public:
	FourthOrderEq() : ThirdOrderEq(), _TqDash(1.0), _XqDash(0.1) { }
	virtual ~FourthOrderEq() GRIDDAE_NOEXCEPT { }

	static const char* identifier() { return "FourthOrderEq"; }
	virtual const char* name() const GRIDDAE_NOEXCEPT { return FourthOrderEq::identifier(); }

	virtual bool configure(IParameterProvider& paramProvider)
	{
		if (!ThirdOrderEq::configure(paramProvider))
			return false;

		_TqDash = paramProvider.getDouble("T_Q_DASH");
		_XqDash = paramProvider.getDouble("X_Q_DASH");
		return _TqDash > 0.0;
	}

	GRIDDAE_NODEMODEL_DYNAMICS_BOILERPLATE

protected:
	double _TqDash;
	double _XqDash;

	template <typename StateType, typename ParamType, typename ResultType>
	void dynamicsImpl(double t, StateType const* u, const util::Complex<StateType>& i, ParamType const* p, ResultType* du) const
	{
		machineDynamics<StateType, ParamType, ResultType>(u, i, p, du, _TqDash, _XqDash, _XqDash);
	}
};

namespace node
{
	void registerSynchronousMachines(std::unordered_map<std::string, std::function<model::INodeModel*()>>& nodes)
	{
		nodes[ThirdOrderEq::identifier()] = []() { return new ThirdOrderEq(); };
		nodes[FourthOrderEq::identifier()] = []() { return new FourthOrderEq(); };
	}
}  // namespace node

} // namespace model

} // namespace griddae
