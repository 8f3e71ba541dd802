// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/calibration_data_provider.hpp"

#include "npuls/common/archive.hpp"
#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/common/slog.hpp"

namespace fs = std::filesystem;

namespace npuls {

std::vector<fs::path> find_calibration_samples(const fs::path& directory) {
    return util::list_files(directory, util::sample_extension, true);
}

CalibrationDataProvider::CalibrationDataProvider(std::shared_ptr<ICompilerToolchain> toolchain)
    : m_toolchain(std::move(toolchain)) {}

std::vector<fs::path> CalibrationDataProvider::generate_synthetic(const std::vector<TensorDescriptor>& inputs,
                                                                  const fs::path& output_dir,
                                                                  size_t sample_count) {
    fs::create_directories(output_dir);
    std::vector<fs::path> files;
    for (size_t i = 1; i <= sample_count; ++i) {
        const auto path = output_dir / ("sample_" + std::to_string(i) + util::sample_extension);
        util::save_sample(path, util::make_filled_feed(inputs, static_cast<double>(i)));
        files.push_back(path);
    }
    return files;
}

CalibrationDataset CalibrationDataProvider::resolve(const fs::path& model,
                                                    const std::optional<std::string>& archive,
                                                    const fs::path& output_dir,
                                                    size_t sample_count) const {
    CalibrationDataset dataset;
    dataset.directory = output_dir;
    fs::create_directories(output_dir);

    if (archive) {
        if (!util::is_zip_archive(*archive)) {
            NPULS_THROW_AS(InvalidCalibrationData, "Calibration data must be a ZIP archive");
        }
        const auto archive_path = fs::path(output_dir).concat(".zip");
        util::write_binary_file(archive_path, *archive);
        try {
            util::unpack_archive(archive_path, output_dir);
        } catch (const Exception& ex) {
            NPULS_THROW_AS(InvalidCalibrationData, "Cannot extract calibration data: ", ex.what());
        }
        slog::info << "Calibration data extracted to " << output_dir.string() << slog::endl;
    } else {
        NPULS_ASSERT(m_toolchain, "Compiler toolchain is not set");
        dataset.synthetic = true;
        generate_synthetic(m_toolchain->read_inputs(model), output_dir, sample_count);
        slog::info << "Generated " << sample_count << " synthetic calibration samples" << slog::endl;
    }

    dataset.samples = find_calibration_samples(output_dir);
    if (dataset.samples.empty()) {
        NPULS_THROW_AS(NoCalibrationData, "No calibration samples (*", util::sample_extension, ") in ", output_dir);
    }
    return dataset;
}

}  // namespace npuls
