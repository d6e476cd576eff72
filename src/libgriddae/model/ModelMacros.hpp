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
 * Provides macros that forward the virtual evaluation functions of node and line models
 * to templated implementations.
 */

#ifndef LIBGRIDDAE_MODELMACROS_HPP_
#define LIBGRIDDAE_MODELMACROS_HPP_

/**
 * @brief Inserts the dynamics() overloads of INodeModel
 * @details The model has to provide
 *          <pre>template <typename StateType, typename ParamType, typename ResultType>
 *          void dynamicsImpl(double t, StateType const* u, const util::Complex<StateType>& i, ParamType const* p, ResultType* du) const</pre>
 */
#define GRIDDAE_NODEMODEL_DYNAMICS_BOILERPLATE                                                                                     \
	virtual void dynamics(double t, double const* u, const util::Complex<double>& i, double const* p, double* du) const            \
	{                                                                                                                              \
		dynamicsImpl<double, double, double>(t, u, i, p, du);                                                                      \
	}                                                                                                                              \
	                                                                                                                               \
	virtual void dynamics(double t, active const* u, const util::Complex<active>& i, double const* p, active* du) const            \
	{                                                                                                                              \
		dynamicsImpl<active, double, active>(t, u, i, p, du);                                                                      \
	}                                                                                                                              \
	                                                                                                                               \
	virtual void dynamics(double t, active const* u, const util::Complex<active>& i, active const* p, active* du) const            \
	{                                                                                                                              \
		dynamicsImpl<active, active, active>(t, u, i, p, du);                                                                      \
	}

/**
 * @brief Inserts the currents() overloads of ILineModel
 * @details The model has to provide
 *          <pre>template <typename StateType>
 *          void currentsImpl(const util::Complex<StateType>& uSrc, const util::Complex<StateType>& uDst, util::Complex<StateType>& iSrc, util::Complex<StateType>& iDst) const</pre>
 */
#define GRIDDAE_LINEMODEL_CURRENTS_BOILERPLATE                                                                                     \
	virtual void currents(const util::Complex<double>& uSrc, const util::Complex<double>& uDst,                                    \
		util::Complex<double>& iSrc, util::Complex<double>& iDst) const                                                            \
	{                                                                                                                              \
		currentsImpl<double>(uSrc, uDst, iSrc, iDst);                                                                              \
	}                                                                                                                              \
	                                                                                                                               \
	virtual void currents(const util::Complex<active>& uSrc, const util::Complex<active>& uDst,                                    \
		util::Complex<active>& iSrc, util::Complex<active>& iDst) const                                                            \
	{                                                                                                                              \
		currentsImpl<active>(uSrc, uDst, iSrc, iDst);                                                                              \
	}

#endif  // LIBGRIDDAE_MODELMACROS_HPP_
