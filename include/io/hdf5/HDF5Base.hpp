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

#ifndef GRIDDAE_HDF5BASE_HPP_
#define GRIDDAE_HDF5BASE_HPP_

#include <string>
#include <vector>
#include <sstream>

#include "common/CompilerSpecific.hpp"
#include "io/IOException.hpp"
#include <hdf5.h>

namespace griddae
{

namespace io
{

/**
 * @brief File and group handling shared by HDF5Reader and HDF5Writer
 * @details Groups are addressed by a stack of names relative to the root group.
 *          Group handles are only held open during a single read or write operation.
 */
class HDF5Base
{
public:
	HDF5Base();
	~HDF5Base() GRIDDAE_NOEXCEPT;

	HDF5Base(const HDF5Base&) = delete;
	HDF5Base& operator=(const HDF5Base&) = delete;

	/// \brief Opens a file in mode @c r (read), @c rw (read / write), or @c c (create / truncate)
	inline void openFile(const std::string& fileName, const std::string& mode = "r");

	/// \brief Closes the currently opened file
	inline void closeFile();

	/// \brief Enters the subgroup with the given name
	inline void pushGroup(const std::string& groupName) { _groupNames.push_back(groupName); }

	/// \brief Leaves the current subgroup
	inline void popGroup() { _groupNames.pop_back(); }

	/// \brief Checks if the given dataset or group exists in the current group
	inline bool exists(const std::string& elementName);

	/// \brief Returns the dimensions of the dataset
	inline std::vector<std::size_t> tensorDimensions(const std::string& elementName);

	inline bool isOpen() const GRIDDAE_NOEXCEPT { return _file >= 0; }

protected:
	hid_t _file;
	std::vector<std::string> _groupNames;
	std::vector<hid_t> _groupsOpened;

	inline hid_t openGroup(bool forceCreation = false);
	inline void closeGroup();
	inline std::string getFullGroupName() const;
	inline hid_t openDataset(const std::string& elementName);
};


HDF5Base::HDF5Base() : _file(-1)
{
	H5Eset_auto(H5E_DEFAULT, NULL, NULL);
}

HDF5Base::~HDF5Base() GRIDDAE_NOEXCEPT
{
	if (_file >= 0)
		closeFile();
}

void HDF5Base::openFile(const std::string& fileName, const std::string& mode)
{
	if (_file >= 0)
		closeFile();

	if      (mode == "r" ) _file = H5Fopen(fileName.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
	else if (mode == "rw") _file = H5Fopen(fileName.c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
	else if (mode == "c" ) _file = H5Fcreate(fileName.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
	else throw IOException("Wrong file open mode " + mode);

	if (_file < 0)
		throw IOException("Failed to open or create HDF5 file \"" + fileName + "\" in mode " + mode);
}

void HDF5Base::closeFile()
{
	closeGroup();
	H5Fclose(_file);
	_file = -1;
}

bool HDF5Base::exists(const std::string& elementName)
{
	const hid_t grp = openGroup();
	const bool result = H5Lexists(grp, elementName.c_str(), H5P_DEFAULT) > 0;
	closeGroup();
	return result;
}

std::vector<std::size_t> HDF5Base::tensorDimensions(const std::string& elementName)
{
	const hid_t dataSet = openDataset(elementName);
	const hid_t dataSpace = H5Dget_space(dataSet);
	const int rank = H5Sget_simple_extent_ndims(dataSpace);

	std::vector<hsize_t> buffer(rank > 0 ? rank : 0);
	if (rank > 0)
		H5Sget_simple_extent_dims(dataSpace, buffer.data(), nullptr);

	H5Sclose(dataSpace);
	H5Dclose(dataSet);

	return std::vector<std::size_t>(buffer.begin(), buffer.end());
}

hid_t HDF5Base::openGroup(bool forceCreation)
{
	if (_file < 0)
		throw IOException("No HDF5 file opened");

	hid_t parent = _file;
	for (const std::string& name : _groupNames)
	{
		hid_t grp = -1;
		if (H5Lexists(parent, name.c_str(), H5P_DEFAULT) > 0)
			grp = H5Gopen2(parent, name.c_str(), H5P_DEFAULT);
		else if (forceCreation)
			grp = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);

		if (grp < 0)
		{
			closeGroup();
			throw IOException("Group '" + getFullGroupName() + "' doesn't exist in file");
		}

		_groupsOpened.push_back(grp);
		parent = grp;
	}

	return parent;
}

void HDF5Base::closeGroup()
{
	while (!_groupsOpened.empty())
	{
		H5Gclose(_groupsOpened.back());
		_groupsOpened.pop_back();
	}
}

std::string HDF5Base::getFullGroupName() const
{
	std::ostringstream oss;
	for (const std::string& name : _groupNames)
		oss << "/" << name;

	const std::string full = oss.str();
	return full.empty() ? std::string("/") : full;
}

hid_t HDF5Base::openDataset(const std::string& elementName)
{
	const hid_t grp = openGroup();
	const hid_t dataSet = (H5Lexists(grp, elementName.c_str(), H5P_DEFAULT) > 0) ? H5Dopen2(grp, elementName.c_str(), H5P_DEFAULT) : -1;
	closeGroup();

	if (dataSet < 0)
		throw IOException("Field \"" + elementName + "\" does not exist in group " + getFullGroupName());

	return dataSet;
}

} // namespace io

} // namespace griddae

#endif /* GRIDDAE_HDF5BASE_HPP_ */
