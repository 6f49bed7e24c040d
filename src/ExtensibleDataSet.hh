// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef EXTENSIBLEDATASET_H_
#define EXTENSIBLEDATASET_H_

#include <string>

#include <H5Cpp.h>

/** @brief A one-dimensional HDF5 data set that grows as records are appended. */
class ExtensibleDataSet {
public:
    /** @brief Default number of records we grow the data set by. */
    static constexpr size_t kDefaultGranularity = 64*1024;

    ExtensibleDataSet(const H5::Group& loc,
                      const std::string& name,
                      const H5::DataType &dt,
                      size_t granularity = kDefaultGranularity);
    ~ExtensibleDataSet();

    ExtensibleDataSet() = delete;
    ExtensibleDataSet(const ExtensibleDataSet&) = delete;
    ExtensibleDataSet& operator=(const ExtensibleDataSet&) = delete;

    /** @brief Number of records written so far */
    size_t size(void) const
    {
        return size_;
    }

    void reserve(size_t size);

    /** @brief Append n records.
     * @return true if the records were written.
     */
    bool write(const void *buf, size_t n);

private:
    H5::DataSet ds_;
    H5::DataType dt_;
    size_t granularity_;
    size_t size_;
    size_t capacity_;
};

#endif /* EXTENSIBLEDATASET_H_ */
