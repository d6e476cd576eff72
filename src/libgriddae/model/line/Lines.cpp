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

#include "model/LineModel.hpp"
#include "model/ModelMacros.hpp"
#include "ParamReaderHelper.hpp"

#include <functional>
#include <unordered_map>
#include <string>
#include <vector>

namespace griddae
{

namespace model
{

/**
 * @brief Line with constant admittance @f$ Y @f$
 * @details @f$ \imath_\text{src} = Y (u_\text{src} - u_\text{dst}) @f$ and
 *          @f$ \imath_\text{dst} = Y (u_\text{dst} - u_\text{src}) @f$.
 */
class StaticLine : public ILineModel
{
public:
	StaticLine() : _y(0.0, 0.0) { }
	virtual ~StaticLine() GRIDDAE_NOEXCEPT { }

	static const char* identifier() { return "StaticLine"; }
	virtual const char* name() const GRIDDAE_NOEXCEPT { return StaticLine::identifier(); }

	virtual bool configure(IParameterProvider& paramProvider)
	{
		readComplexParameter(paramProvider, "Y", _y.re, _y.im);
		return true;
	}

	GRIDDAE_LINEMODEL_CURRENTS_BOILERPLATE

protected:
	util::Complex<double> _y; //!< Admittance

	template <typename StateType>
	void currentsImpl(const util::Complex<StateType>& uSrc, const util::Complex<StateType>& uDst, util::Complex<StateType>& iSrc, util::Complex<StateType>& iDst) const
	{
		iSrc = _y * (uSrc - uDst);
		iDst = _y * (uDst - uSrc);
	}
};

/**
 * @brief Pi model of a line with shunt admittances and real tap ratios
 * @details @f$ \imath_\text{src} = t_{km}^2 (y + y_{km}^\text{shunt}) u_\text{src} - t_{km} t_{mk} y u_\text{dst} @f$ and
 *          @f$ \imath_\text{dst} = t_{mk}^2 (y + y_{mk}^\text{shunt}) u_\text{dst} - t_{km} t_{mk} y u_\text{src} @f$.
 */
class PiModelLine : public ILineModel
{
public:
	PiModelLine() : _y(0.0, 0.0), _yShuntKm(0.0, 0.0), _yShuntMk(0.0, 0.0), _tKm(1.0), _tMk(1.0) { }
	virtual ~PiModelLine() GRIDDAE_NOEXCEPT { }

	static const char* identifier() { return "PiModelLine"; }
	virtual const char* name() const GRIDDAE_NOEXCEPT { return PiModelLine::identifier(); }

	virtual bool configure(IParameterProvider& paramProvider)
	{
		readComplexParameter(paramProvider, "Y", _y.re, _y.im);
		readOptionalComplexParameter(paramProvider, "Y_SHUNT_KM", _yShuntKm.re, _yShuntKm.im);
		readOptionalComplexParameter(paramProvider, "Y_SHUNT_MK", _yShuntMk.re, _yShuntMk.im);

		if (paramProvider.exists("T_KM"))
			_tKm = paramProvider.getDouble("T_KM");
		if (paramProvider.exists("T_MK"))
			_tMk = paramProvider.getDouble("T_MK");

		return true;
	}

	GRIDDAE_LINEMODEL_CURRENTS_BOILERPLATE

protected:
	util::Complex<double> _y; //!< Series admittance
	util::Complex<double> _yShuntKm; //!< Shunt admittance at the source
	util::Complex<double> _yShuntMk; //!< Shunt admittance at the destination
	double _tKm; //!< Tap ratio at the source
	double _tMk; //!< Tap ratio at the destination

	template <typename StateType>
	void currentsImpl(const util::Complex<StateType>& uSrc, const util::Complex<StateType>& uDst, util::Complex<StateType>& iSrc, util::Complex<StateType>& iDst) const
	{
		const util::Complex<double> ySeries = util::scale(_y, _tKm * _tMk);
		iSrc = util::scale(_y + _yShuntKm, _tKm * _tKm) * uSrc - ySeries * uDst;
		iDst = util::scale(_y + _yShuntMk, _tMk * _tMk) * uDst - ySeries * uSrc;
	}
};

namespace line
{
	void registerLines(std::unordered_map<std::string, std::function<model::ILineModel*()>>& lines)
	{
		lines[StaticLine::identifier()] = []() { return new StaticLine(); };
		lines[PiModelLine::identifier()] = []() { return new PiModelLine(); };
	}
}  // namespace line

} // namespace model

} // namespace griddae
