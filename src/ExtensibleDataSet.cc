// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <stdio.h>

#include "ExtensibleDataSet.hh"

ExtensibleDataSet::ExtensibleDataSet(const H5::Group& loc,
                                     const std::string& name,
                                     const H5::DataType &dt,
                                     size_t granularity)
  : dt_(dt)
  , granularity_(granularity)
  , size_(0)
  , capacity_(granularity)
{
    hsize_t               dim[] = { granularity_ };
    hsize_t               maxdims[] = { H5S_UNLIMITED };
    hsize_t               chunk_dims[] = { granularity_ };
    H5::DataSpace         space(1, dim, maxdims);
    H5::DSetCreatPropList plist;

    plist.setChunk(1, chunk_dims);
    ds_ = loc.createDataSet(name, dt_, space, plist);
}

ExtensibleDataSet::~ExtensibleDataSet()
{
    hsize_t dim[] = { size_ };

    try {
        ds_.extend(dim);
        ds_.close();
    } catch (H5::Exception &e) {
        fprintf(stderr, "HDF5 exception: %s: %s\n",
            e.getCFuncName(),
            e.getCDetailMsg());
    }
}

void ExtensibleDataSet::reserve(size_t capacity)
{
    if (capacity > capacity_) {
        capacity_ = granularity_ * ((capacity + granularity_ - 1) / granularity_);

        hsize_t dim[] = { capacity_ };

        ds_.extend(dim);
    }
}

bool ExtensibleDataSet::write(const void *buf, size_t n)
{
    hsize_t count[] = { n };
    hsize_t off[] = { size_ };

    try {
        reserve(size_+n);

        // Create a *copy* of the data space.
        H5::DataSpace space(ds_.getSpace());
        // The subspace we will modify.
        H5::DataSpace memspace(1, count, NULL);

        space.selectHyperslab(H5S_SELECT_SET, count, off);
        ds_.write(buf, dt_, memspace, space);

        size_ += n;
        return true;
    } catch(H5::DataSetIException &e) {
        fprintf(stderr, "HDF5 exception: %s: %s\n",
            e.getCFuncName(),
            e.getCDetailMsg());
        return false;
    }
}
