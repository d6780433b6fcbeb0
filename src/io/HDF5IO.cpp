// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <pointcloud_dataset/io/HDF5IO.hpp>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace pointcloud_dataset {

bool HDF5IO::isValidHDF5(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        return false;
    }

    htri_t is_hdf5 = H5Fis_hdf5(filename.c_str());
    return is_hdf5 > 0;
}

bool HDF5IO::checkParentDirectory(const std::string& filename) {
    std::filesystem::path filepath(filename);
    const auto parent = filepath.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        last_error_ = "Directory does not exist: " + parent.string();
        return false;
    }
    return true;
}

bool HDF5IO::readPoints(const std::string& filename, PointArray& points) {
    points.clear();

    if (!isValidHDF5(filename)) {
        last_error_ = "Not a readable HDF5 file: " + filename;
        return false;
    }

    hid_t file_id = H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file_id < 0) {
        last_error_ = "Failed to open HDF5 file: " + filename;
        return false;
    }

    if (H5Lexists(file_id, "points", H5P_DEFAULT) <= 0) {
        H5Fclose(file_id);
        last_error_ = "HDF5 file has no 'points' dataset: " + filename;
        return false;
    }

    hid_t dataset = H5Dopen2(file_id, "points", H5P_DEFAULT);
    if (dataset < 0) {
        H5Fclose(file_id);
        last_error_ = "Failed to open 'points' dataset: " + filename;
        return false;
    }

    hid_t space = H5Dget_space(dataset);
    const int rank = H5Sget_simple_extent_ndims(space);
    bool ok = true;
    if (rank != 1 && rank != 2) {
        last_error_ = "'points' dataset must be 1-D or 2-D: " + filename;
        ok = false;
    } else {
        hsize_t dims[2] = {0, 1};
        H5Sget_simple_extent_dims(space, dims, nullptr);
        points.rows = static_cast<std::size_t>(dims[0]);
        points.cols = rank == 2 ? static_cast<std::size_t>(dims[1]) : 1;
        points.values.resize(points.rows * points.cols);
        if (!points.values.empty()) {
            herr_t status = H5Dread(dataset, H5T_NATIVE_FLOAT, H5S_ALL, H5S_ALL, H5P_DEFAULT,
                                    points.values.data());
            if (status < 0) {
                last_error_ = "Failed to read 'points' dataset: " + filename;
                ok = false;
            }
        }
    }

    H5Sclose(space);
    H5Dclose(dataset);
    H5Fclose(file_id);

    if (!ok) {
        points.clear();
    }
    return ok;
}

bool HDF5IO::writePoints(const std::string& filename, const PointArray& points) {
    if (!checkParentDirectory(filename)) {
        return false;
    }

    hid_t file_id = H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file_id < 0) {
        last_error_ = "Failed to create HDF5 file: " + filename;
        return false;
    }

    hsize_t dims[2] = {static_cast<hsize_t>(points.rows), static_cast<hsize_t>(points.cols)};
    herr_t status = H5LTmake_dataset_float(file_id, "points", 2, dims, points.values.data());
    H5Fclose(file_id);

    if (status < 0) {
        last_error_ = "Failed to write 'points' dataset: " + filename;
        std::filesystem::remove(filename);
        return false;
    }
    return true;
}

bool HDF5IO::writeEpoch(const std::string& filename, const EpochData& epoch) {
    auto t0 = std::chrono::high_resolution_clock::now();

    const std::size_t examples = epoch.numExamples();
    const std::size_t expected = examples * epoch.num_points * epoch.num_channels;
    if (epoch.data.size() != expected || epoch.weights.size() != examples) {
        std::ostringstream oss;
        oss << "epoch arrays are inconsistent (data=" << epoch.data.size() << ", expected "
            << expected << ", weights=" << epoch.weights.size() << ", labels=" << examples << ")";
        last_error_ = oss.str();
        return false;
    }

    if (!checkParentDirectory(filename)) {
        return false;
    }

    hid_t file_id = H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file_id < 0) {
        last_error_ = "Failed to create HDF5 file: " + filename;
        return false;
    }

    bool success = true;

    hsize_t data_dims[3] = {static_cast<hsize_t>(examples),
                            static_cast<hsize_t>(epoch.num_points),
                            static_cast<hsize_t>(epoch.num_channels)};
    if (H5LTmake_dataset_float(file_id, "data", 3, data_dims, epoch.data.data()) < 0) {
        last_error_ = "Failed to write 'data' dataset";
        success = false;
    }

    hsize_t example_dims[1] = {static_cast<hsize_t>(examples)};
    if (success && H5LTmake_dataset_int(file_id, "labels", 1, example_dims, epoch.labels.data()) < 0) {
        last_error_ = "Failed to write 'labels' dataset";
        success = false;
    }
    if (success && H5LTmake_dataset_float(file_id, "weights", 1, example_dims, epoch.weights.data()) < 0) {
        last_error_ = "Failed to write 'weights' dataset";
        success = false;
    }

    success = success && writeClassNames(file_id, epoch.class_names);
    success = success && writeStringAttribute(file_id, "split", epoch.split);
    if (success) {
        const unsigned int shape[2] = {epoch.num_points, epoch.num_channels};
        if (H5LTset_attribute_uint(file_id, "/", "point_shape", shape, 2) < 0) {
            last_error_ = "Failed to write 'point_shape' attribute";
            success = false;
        }
    }

    H5Fclose(file_id);

    if (!success) {
        std::filesystem::remove(filename);
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    std::cout << "[PROFILE][HDF5IO] write file='" << filename << "' examples=" << examples
              << " time=" << ms << " ms" << std::endl;
    return success;
}

bool HDF5IO::readEpoch(const std::string& filename, EpochData& epoch) {
    epoch = EpochData();

    if (!isValidHDF5(filename)) {
        last_error_ = "Not a readable HDF5 file: " + filename;
        return false;
    }

    hid_t file_id = H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file_id < 0) {
        last_error_ = "Failed to open HDF5 file: " + filename;
        return false;
    }

    bool success = true;
    unsigned int shape[2] = {0, 0};
    if (H5LTget_attribute_uint(file_id, "/", "point_shape", shape) < 0) {
        last_error_ = "Missing 'point_shape' attribute";
        success = false;
    }
    epoch.num_points = shape[0];
    epoch.num_channels = shape[1];

    if (success) {
        hsize_t dims[3] = {0, 0, 0};
        if (H5LTget_dataset_info(file_id, "data", dims, nullptr, nullptr) < 0) {
            last_error_ = "Missing 'data' dataset";
            success = false;
        } else {
            const std::size_t examples = static_cast<std::size_t>(dims[0]);
            epoch.data.resize(examples * epoch.num_points * epoch.num_channels);
            epoch.labels.resize(examples);
            epoch.weights.resize(examples);
            success = H5LTread_dataset_float(file_id, "data", epoch.data.data()) >= 0 &&
                      H5LTread_dataset_int(file_id, "labels", epoch.labels.data()) >= 0 &&
                      H5LTread_dataset_float(file_id, "weights", epoch.weights.data()) >= 0;
            if (!success) {
                last_error_ = "Failed to read epoch datasets";
            }
        }
    }

    success = success && readClassNames(file_id, epoch.class_names);
    success = success && readStringAttribute(file_id, "split", epoch.split);

    H5Fclose(file_id);
    return success;
}

bool HDF5IO::writeClassNames(hid_t file_id, const std::vector<std::string>& names) {
    std::size_t width = 1;
    for (const auto& name : names) {
        width = std::max(width, name.size() + 1);
    }

    std::vector<char> buffer(std::max<std::size_t>(names.size(), 1) * width, '\0');
    for (std::size_t i = 0; i < names.size(); ++i) {
        std::memcpy(buffer.data() + i * width, names[i].data(), names[i].size());
    }

    hid_t str_type = H5Tcopy(H5T_C_S1);
    H5Tset_size(str_type, width);
    H5Tset_strpad(str_type, H5T_STR_NULLTERM);

    hsize_t dims = static_cast<hsize_t>(names.size());
    hid_t space = H5Screate_simple(1, &dims, nullptr);
    hid_t dataset = H5Dcreate2(file_id, "class_names", str_type, space,
                               H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    bool ok = dataset >= 0;
    if (ok && !names.empty()) {
        ok = H5Dwrite(dataset, str_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) >= 0;
    }
    if (!ok) {
        last_error_ = "Failed to write 'class_names' dataset";
    }

    if (dataset >= 0) H5Dclose(dataset);
    H5Sclose(space);
    H5Tclose(str_type);
    return ok;
}

bool HDF5IO::readClassNames(hid_t file_id, std::vector<std::string>& names) {
    names.clear();

    hid_t dataset = H5Dopen2(file_id, "class_names", H5P_DEFAULT);
    if (dataset < 0) {
        last_error_ = "Missing 'class_names' dataset";
        return false;
    }

    hid_t file_type = H5Dget_type(dataset);
    const std::size_t width = H5Tget_size(file_type);
    hid_t space = H5Dget_space(dataset);
    hsize_t dims = 0;
    H5Sget_simple_extent_dims(space, &dims, nullptr);

    bool ok = true;
    if (dims > 0) {
        hid_t mem_type = H5Tcopy(H5T_C_S1);
        H5Tset_size(mem_type, width);
        std::vector<char> buffer(static_cast<std::size_t>(dims) * width, '\0');
        ok = H5Dread(dataset, mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) >= 0;
        H5Tclose(mem_type);
        for (hsize_t i = 0; ok && i < dims; ++i) {
            const char* start = buffer.data() + i * width;
            names.emplace_back(start, strnlen(start, width));
        }
    }
    if (!ok) {
        last_error_ = "Failed to read 'class_names' dataset";
    }

    H5Sclose(space);
    H5Tclose(file_type);
    H5Dclose(dataset);
    return ok;
}

bool HDF5IO::writeStringAttribute(hid_t loc_id, const std::string& name, const std::string& value) {
    if (H5LTset_attribute_string(loc_id, "/", name.c_str(), value.c_str()) < 0) {
        last_error_ = "Failed to write attribute '" + name + "'";
        return false;
    }
    return true;
}

bool HDF5IO::readStringAttribute(hid_t loc_id, const std::string& name, std::string& value) {
    hsize_t dims = 0;
    H5T_class_t type_class;
    size_t type_size = 0;
    if (H5LTget_attribute_info(loc_id, "/", name.c_str(), &dims, &type_class, &type_size) < 0) {
        last_error_ = "Missing attribute '" + name + "'";
        return false;
    }

    std::vector<char> buffer(type_size + 1, '\0');
    if (H5LTget_attribute_string(loc_id, "/", name.c_str(), buffer.data()) < 0) {
        last_error_ = "Failed to read attribute '" + name + "'";
        return false;
    }
    value.assign(buffer.data());
    return true;
}

}  // namespace pointcloud_dataset
