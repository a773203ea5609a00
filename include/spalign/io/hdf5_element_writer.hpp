/**
 * @file hdf5_element_writer.hpp
 * @brief HDF5 writer for spatial elements and datasets
 */

#pragma once

#include "spalign/elements/spatial_dataset.hpp"
#include "spalign/elements/spatial_element.hpp"
#include <memory>
#include <string>

// Forward declarations to avoid requiring HDF5 headers when HDF5 is not available
namespace H5 {
    class H5File;
    class Group;
}

namespace spalign {
namespace io {

/**
 * @brief HDF5 element writer
 *
 * @details File layout:
 * - /images/<name>, /labels/<name>: one dataset per level ("scale0", "scale1", ...)
 * - /points/<name>/coords: [N,D] coordinates, attribute columns under /points/<name>/attributes
 * - /shapes/<name>: flattened vertices with ring/part/geometry offsets
 *
 * Each element group carries string attributes "element_kind", "axes" (JSON list)
 * and "transformations" (registry JSON). Raster datasets carry "dtype".
 */
class HDF5ElementWriter {
public:
    HDF5ElementWriter();
    ~HDF5ElementWriter();

    HDF5ElementWriter(const HDF5ElementWriter&) = delete;
    HDF5ElementWriter& operator=(const HDF5ElementWriter&) = delete;

    /**
     * @brief Open the output file
     * @param file_path Output path, parent directories are created
     * @param overwrite Truncate an existing file; otherwise an existing file is an error
     * @throws IOError if HDF5 is not available or the file cannot be created
     */
    void open(const std::string& file_path, bool overwrite = true);

    /**
     * @brief Write one element under /<group>/<name>
     * @throws IOError if the writer is not open or the write fails
     */
    void writeElement(elements::ElementGroup group,
                      const std::string& name,
                      const elements::SpatialElement& element);

    /**
     * @brief Write every element of a dataset and the catalog summary
     */
    void writeDataset(const elements::SpatialDataset& dataset);

    /**
     * @brief Flush and close the file
     */
    void close();

    bool isOpen() const { return open_; }
    const std::string& filePath() const { return file_path_; }

    /**
     * @brief Check if HDF5 library is available at build time
     */
    static bool isHDF5Available();

    /**
     * @brief Convenience: open, write the whole dataset, close
     */
    static void writeToFile(const elements::SpatialDataset& dataset,
                            const std::string& file_path,
                            bool overwrite = true);

private:
    struct HDF5ElementWriterImpl;
    std::unique_ptr<HDF5ElementWriterImpl> impl_;  ///< PIMPL idiom to hide HDF5 dependencies

    bool open_;
    std::string file_path_;
};

} // namespace io
} // namespace spalign
