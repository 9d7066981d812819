#pragma once

// RAII wrappers for GLib types.

#include <glib.h>
#include <glib-object.h>

#include <memory>
#include <string>

namespace evpn::glib {

template <typename T>
struct GObjectUnref {
    void operator()(T* obj) const {
        if (obj) g_object_unref(obj);
    }
};

template <typename T>
using ScopedGObject = std::unique_ptr<T, GObjectUnref<T>>;

// Takes an additional reference; use for borrowed (transfer none) pointers.
template <typename T>
ScopedGObject<T> retain(T* obj) {
    if (obj) g_object_ref(obj);
    return ScopedGObject<T>(obj);
}

struct GErrorFree {
    void operator()(GError* err) const {
        if (err) g_error_free(err);
    }
};

using ScopedGError = std::unique_ptr<GError, GErrorFree>;

struct GVariantUnref {
    void operator()(GVariant* v) const {
        if (v) g_variant_unref(v);
    }
};

using ScopedGVariant = std::unique_ptr<GVariant, GVariantUnref>;

struct GMainLoopUnref {
    void operator()(GMainLoop* loop) const {
        if (loop) g_main_loop_unref(loop);
    }
};

using ScopedGMainLoop = std::unique_ptr<GMainLoop, GMainLoopUnref>;

inline std::string messageOf(const GError* err) {
    return err && err->message ? err->message : "unknown error";
}

}
