#ifndef STORE_CODEC_HPP
#define STORE_CODEC_HPP

#include <string>

#include "capnp/session.capnp.h"
#include "session/model.hpp"

namespace store {

void ToCapnp(const session::Session& session,
             capnproto::Session::Builder builder);
session::Session FromCapnp(capnproto::Session::Reader reader);

// A versioned record as a flat capnp message.
std::string Serialize(const session::Session& session, uint64_t version);
// Throws kj::Exception if data is not a valid record.
session::Session Deserialize(const std::string& data, uint64_t* version);
// Version of a record, without decoding the session.
uint64_t RecordVersion(const std::string& data);

// Human readable rendition of a session, for operators.
std::string ToJson(const session::Session& session);

}  // namespace store

#endif
