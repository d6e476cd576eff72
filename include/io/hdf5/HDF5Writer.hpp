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

#ifndef GRIDDAE_HDF5WRITER_HPP_
#define GRIDDAE_HDF5WRITER_HPP_

#include <vector>
#include <string>

#include "HDF5Base.hpp"

namespace griddae
{

namespace io
{

class HDF5Writer : public HDF5Base
{
public:
	HDF5Writer() : _writeCompressed(false) { }
	~HDF5Writer() GRIDDAE_NOEXCEPT { }

	/// \brief Writes data from a C-array to a dataset in the current group
	template <typename T>
	void write(const std::string& dataSetName, const std::size_t rank, const std::size_t* dims, const T* buffer);

	/// \brief Writes a row-major matrix
	template <typename T>
	void matrix(const std::string& dataSetName, const std::size_t rows, const std::size_t cols, const std::vector<T>& buffer)
	{
		if (rows * cols > buffer.size())
			throw IOException("Matrix \"" + dataSetName + "\" exceeds the given buffer");

		const std::size_t dims[2] = {rows, cols};
		write<T>(dataSetName, 2, dims, buffer.data());
	}

	template <typename T>
	void vector(const std::string& dataSetName, const std::vector<T>& buffer)
	{
		const std::size_t length = buffer.size();
		write<T>(dataSetName, 1, &length, buffer.data());
	}

	template <typename T>
	void scalar(const std::string& dataSetName, const T buffer)
	{
		const std::size_t length = 1;
		write<T>(dataSetName, 1, &length, &buffer);
	}

	/// \brief Enables deflate compression for datasets of rank 2 and above
	inline void compressFields(bool setCompression) { _writeCompressed = setCompression; }

private:
	bool _writeCompressed;

	inline void writeWork(const std::string& dataSetName, hid_t memType, hid_t fileType, const std::size_t rank, const std::size_t* dims, const void* buffer);
};


template <>
inline void HDF5Writer::write<double>(const std::string& dataSetName, const std::size_t rank, const std::size_t* dims, const double* buffer)
{
	writeWork(dataSetName, H5T_NATIVE_DOUBLE, H5T_IEEE_F64LE, rank, dims, buffer);
}

template <>
inline void HDF5Writer::write<int>(const std::string& dataSetName, const std::size_t rank, const std::size_t* dims, const int* buffer)
{
	writeWork(dataSetName, H5T_NATIVE_INT, H5T_STD_I32LE, rank, dims, buffer);
}

template <>
inline void HDF5Writer::write<std::string>(const std::string& dataSetName, const std::size_t rank, const std::size_t* dims, const std::string* buffer)
{
	hid_t dataType = H5Tcopy(H5T_C_S1);
	H5Tset_size(dataType, H5T_VARIABLE);

	std::size_t bufSize = 1;
	for (std::size_t i = 0; i < rank; ++i)
		bufSize *= dims[i];

	std::vector<const char*> strBuffer(bufSize);
	for (std::size_t i = 0; i < bufSize; ++i)
		strBuffer[i] = buffer[i].c_str();

	try
	{
		writeWork(dataSetName, dataType, dataType, rank, dims, strBuffer.data());
	}
	catch (const IOException&)
	{
		H5Tclose(dataType);
		throw;
	}

	H5Tclose(dataType);
}

template <typename T>
void HDF5Writer::write(const std::string& dataSetName, const std::size_t rank, const std::size_t* dims, const T* buffer)
{
	throw IOException("You may not try to write an unsupported type");
}

void HDF5Writer::writeWork(const std::string& dataSetName, hid_t memType, hid_t fileType, const std::size_t rank, const std::size_t* dims, const void* buffer)
{
	std::vector<hsize_t> convDims(dims, dims + rank);

	hid_t propList = H5Pcreate(H5P_DATASET_CREATE);
	if (_writeCompressed && (rank >= 2))
	{
		H5Pset_chunk(propList, rank, convDims.data());
		H5Pset_deflate(propList, 9);
	}

	const hid_t dataSpace = H5Screate_simple(rank, convDims.data(), nullptr);

	const hid_t grp = openGroup(true);
	if (H5Lexists(grp, dataSetName.c_str(), H5P_DEFAULT) > 0)
		H5Ldelete(grp, dataSetName.c_str(), H5P_DEFAULT);
	const hid_t dataSet = H5Dcreate2(grp, dataSetName.c_str(), fileType, dataSpace, H5P_DEFAULT, propList, H5P_DEFAULT);
	closeGroup();

	H5Sclose(dataSpace);
	H5Pclose(propList);

	if (dataSet < 0)
		throw IOException("Cannot create field \"" + dataSetName + "\" in group " + getFullGroupName());

	const herr_t status = H5Dwrite(dataSet, memType, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer);
	H5Dclose(dataSet);

	if (status < 0)
		throw IOException("Cannot write field \"" + dataSetName + "\" in group " + getFullGroupName());
}

} // namespace io

} // namespace griddae

#endif /* GRIDDAE_HDF5WRITER_HPP_ */
