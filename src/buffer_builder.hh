#pragma once

#include <cstring>
#include <linux/netlink.h>

#include "int.hh"
#include "str.hh"

namespace trafficmon {

// Class used to construct netlink buffers: messages, attributes & nested
// attributes.
struct BufferBuilder {
  Str buffer;

  template <typename T> struct Ref {
    BufferBuilder &builder;
    Size offset;
    T &operator*() { return *(T *)(builder.buffer.data() + offset); }
    T *operator->() { return (T *)(builder.buffer.data() + offset); }
  };

  BufferBuilder() = default;
  BufferBuilder(Size initial_capacity) { buffer.reserve(initial_capacity); }

  template <typename T> Ref<T> AppendPrimitive(const T &t) {
    Ref<T> ref{
        .builder = *this,
        .offset = buffer.size(),
    };
    buffer.append((const char *)&t, sizeof(T));
    return ref;
  }

  void AppendBytes(StrView bytes) { buffer.append(bytes); }

  void AppendZeroes(Size n) { buffer.append(n, '\0'); }

  // Aligns the buffer to the given alignment.
  //
  // The alignment must be a power of two.
  template <U8 alignment> void AlignTo() {
    static_assert((alignment & (alignment - 1)) == 0);
    if (buffer.size() & (alignment - 1)) {
      buffer.resize((buffer.size() + alignment - 1) & ~(alignment - 1));
    }
  }

  // Starts an attribute whose length is filled in by `EndAttr`.
  //
  // Returns the offset of the attribute header.
  Size BeginAttr(U16 type) {
    AlignTo<NLA_ALIGNTO>();
    Size offset = buffer.size();
    AppendPrimitive(nlattr{.nla_len = 0, .nla_type = type});
    return offset;
  }

  Size BeginNested(U16 type) { return BeginAttr(type | NLA_F_NESTED); }

  // Sets the length of the attribute started at `offset` & pads the buffer.
  void EndAttr(Size offset) {
    U16 len = buffer.size() - offset;
    memcpy(buffer.data() + offset + offsetof(nlattr, nla_len), &len,
           sizeof(len));
    AlignTo<NLA_ALIGNTO>();
  }

  void AppendAttr(U16 type, StrView payload) {
    Size offset = BeginAttr(type);
    AppendBytes(payload);
    EndAttr(offset);
  }

  // String attribute, including the NUL terminator.
  void AppendAttrCStr(U16 type, StrView s) {
    Size offset = BeginAttr(type);
    AppendBytes(s);
    AppendZeroes(1);
    EndAttr(offset);
  }

  template <typename T> void AppendAttrT(U16 type, const T &value) {
    Size offset = BeginAttr(type);
    AppendPrimitive(value);
    EndAttr(offset);
  }

  Size Length() const { return buffer.size(); }
};

} // namespace trafficmon
