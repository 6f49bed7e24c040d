// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef PY_SHARED_PTR_HH_
#define PY_SHARED_PTR_HH_

#include <memory>

#include <pybind11/pybind11.h>

// See:
//   https://pybind11.readthedocs.io/en/stable/advanced/cast/custom.html
//   https://github.com/pybind/pybind11/issues/1145
//   https://github.com/pybind/pybind11/issues/1389
//   https://github.com/pybind/pybind11/issues/1546
//
//   https://github.com/pybind/pybind11/pull/1146

namespace pybind11::detail {

/** @brief A std::shared_ptr caster that keeps the Python object alive */
/** Algorithms, transports, and listeners written in Python are held by C++
 * long after Python has dropped its last reference, so the shared_ptr handed
 * to C++ owns a reference to the Python object rather than only to its C++
 * base.
 */
template <class T>
struct py_shared_ptr_caster
{
    PYBIND11_TYPE_CASTER(std::shared_ptr<T>, _<T>());

    using BaseCaster = copyable_holder_caster<T, std::shared_ptr<T>>;

    bool load(pybind11::handle src, bool convert)
    {
        BaseCaster bc;

        if (!bc.load(src, convert))
            return false;

        auto py_obj = reinterpret_borrow<object>(src);
        auto base_ptr = static_cast<std::shared_ptr<T>>(bc);

        // Construct a shared_ptr to the py::object
        auto py_obj_ptr = std::shared_ptr<object>{
            new object{py_obj},
            [](auto py_object_ptr) {
                // The last holder may be a control task's worker thread, which
                // does not hold the GIL.
                gil_scoped_acquire gil;
                delete py_object_ptr;
            }
        };

        value = std::shared_ptr<T>(py_obj_ptr, base_ptr.get());
        return true;
    }

    static handle cast(std::shared_ptr<T> base,
                       return_value_policy rvp,
                       handle h)
    {
        return BaseCaster::cast(base, rvp, h);
    }
};

}

/** @brief Hold Python subclasses of T by a Python-owning std::shared_ptr */
#define PY_SHARED_PTR_HOLDER(T) \
    namespace pybind11::detail { \
    template <> \
    struct type_caster<std::shared_ptr<T>> : public py_shared_ptr_caster<T> {}; \
    \
    template <> \
    struct is_holder_type<T, std::shared_ptr<T>> : std::true_type {}; \
    }

#endif /* PY_SHARED_PTR_HH_ */
