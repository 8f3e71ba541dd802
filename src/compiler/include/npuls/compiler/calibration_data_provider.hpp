// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "npuls/compiler/toolchain.hpp"

namespace npuls {

/// @brief Calibration samples persisted as files of one directory
struct CalibrationDataset {
    std::filesystem::path directory;
    std::vector<std::filesystem::path> samples;
    /// Generated placeholder data: the compiled model has no accuracy guarantee
    bool synthetic = false;
};

/// @brief Sample files of a calibration directory, in the order the compiler consumes them
std::vector<std::filesystem::path> find_calibration_samples(const std::filesystem::path& directory);

/**
 * @brief Produces the calibration dataset of a compilation job
 *
 * A supplied archive is unpacked as is. Without one, placeholder samples are generated:
 * sample i (1-based) fills every declared input entirely with the value i.
 */
class CalibrationDataProvider {
public:
    static constexpr size_t default_sample_count = 2;

    explicit CalibrationDataProvider(std::shared_ptr<ICompilerToolchain> toolchain);

    /**
     * @param model Model whose declared inputs shape the synthetic samples
     * @param archive ZIP archive bytes supplied by the client, if any
     * @param output_dir Directory receiving the samples, must be empty or missing
     * @param sample_count Number of synthetic samples
     * @throw npuls::InvalidCalibrationData when the archive cannot be extracted
     * @throw npuls::NoCalibrationData when the directory ends up without samples
     */
    CalibrationDataset resolve(const std::filesystem::path& model,
                               const std::optional<std::string>& archive,
                               const std::filesystem::path& output_dir,
                               size_t sample_count = default_sample_count) const;

    /// @brief Writes synthetic samples for the given inputs, returns the written files
    static std::vector<std::filesystem::path> generate_synthetic(const std::vector<TensorDescriptor>& inputs,
                                                                 const std::filesystem::path& output_dir,
                                                                 size_t sample_count);

private:
    std::shared_ptr<ICompilerToolchain> m_toolchain;
};

}  // namespace npuls
