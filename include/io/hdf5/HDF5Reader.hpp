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

#ifndef GRIDDAE_HDF5READER_HPP_
#define GRIDDAE_HDF5READER_HPP_

#include <vector>
#include <string>

#include "HDF5Base.hpp"

namespace griddae
{

namespace io
{

/**
 * @brief Reads flattened datasets from the current group
 */
class HDF5Reader : public HDF5Base
{
public:
	HDF5Reader() { }
	~HDF5Reader() GRIDDAE_NOEXCEPT { }

	template <typename T>
	std::vector<T> vector(const std::string& dataSetName);

	template <typename T>
	T scalar(const std::string& dataSetName, std::size_t position = 0)
	{
		return vector<T>(dataSetName).at(position);
	}

private:
	template <typename T>
	std::vector<T> read(const std::string& dataSetName, hid_t memType);
};


template <>
inline std::vector<double> HDF5Reader::vector<double>(const std::string& dataSetName)
{
	return read<double>(dataSetName, H5T_NATIVE_DOUBLE);
}

template <>
inline std::vector<int> HDF5Reader::vector<int>(const std::string& dataSetName)
{
	return read<int>(dataSetName, H5T_NATIVE_INT);
}

template <>
inline std::vector<std::string> HDF5Reader::vector<std::string>(const std::string& dataSetName)
{
	const hid_t dataSet = openDataset(dataSetName);
	const hid_t dataType = H5Dget_type(dataSet);
	const hid_t dataSpace = H5Dget_space(dataSet);
	const std::size_t bufSize = H5Sget_simple_extent_npoints(dataSpace);

	std::vector<std::string> result;
	result.reserve(bufSize);

	if ((bufSize > 0) && (H5Tis_variable_str(dataType) > 0))
	{
		std::vector<char*> buffer(bufSize, nullptr);
		const hid_t memType = H5Tcopy(H5T_C_S1);
		H5Tset_size(memType, H5T_VARIABLE);

		if (H5Dread(dataSet, memType, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) >= 0)
		{
			for (std::size_t i = 0; i < bufSize; ++i)
				result.push_back(std::string(buffer[i]));

			H5Dvlen_reclaim(memType, dataSpace, H5P_DEFAULT, buffer.data());
		}
		H5Tclose(memType);
	}
	else if (bufSize > 0)
	{
		const std::size_t strLen = H5Tget_size(dataType) + 1;
		std::vector<char> buffer(strLen * bufSize, '\0');

		const hid_t memType = H5Tcopy(H5T_C_S1);
		H5Tset_size(memType, strLen);

		if (H5Dread(dataSet, memType, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) >= 0)
		{
			for (std::size_t i = 0; i < bufSize; ++i)
				result.push_back(std::string(buffer.data() + i * strLen));
		}
		H5Tclose(memType);
	}

	H5Tclose(dataType);
	H5Sclose(dataSpace);
	H5Dclose(dataSet);

	if (result.size() != bufSize)
		throw IOException("Cannot read field \"" + dataSetName + "\" in group " + getFullGroupName());

	return result;
}

template <typename T>
std::vector<T> HDF5Reader::vector(const std::string& dataSetName)
{
	throw IOException("You may not try to read an unsupported type");
}

template <typename T>
std::vector<T> HDF5Reader::read(const std::string& dataSetName, hid_t memType)
{
	const hid_t dataSet = openDataset(dataSetName);
	const hid_t dataSpace = H5Dget_space(dataSet);
	const std::size_t bufSize = H5Sget_simple_extent_npoints(dataSpace);
	H5Sclose(dataSpace);

	std::vector<T> buffer(bufSize);
	const herr_t status = (bufSize > 0) ? H5Dread(dataSet, memType, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) : 0;
	H5Dclose(dataSet);

	if (status < 0)
		throw IOException("Cannot read field \"" + dataSetName + "\" in group " + getFullGroupName());

	return buffer;
}

} // namespace io

} // namespace griddae

#endif /* GRIDDAE_HDF5READER_HPP_ */
