#include "LocalSessionClient.hpp"

#include <exception>

namespace sgw {

LocalSessionClient::LocalSessionClient(const std::string& dbPath, const LocalFSBackend& fs)
  : store_(std::make_unique<MetadataStore>(dbPath)), fs_(fs) {}

Result<ObjectProperties> LocalSessionClient::fetch_properties(int64_t id) {
  try {
    auto rec = store_->findObject(id);
    if (!rec) return make_error(ErrorKind::ObjectNotFound, "File not found");

    ObjectProperties props;
    props.id           = rec->id;
    props.content_hash = rec->content_hash;
    props.size         = rec->size;
    props.mime_type    = rec->mime_type;
    props.file_name    = rec->file_name;
    return props;
  } catch (const std::exception& e) {
    return make_error(ErrorKind::UpstreamFetchFailure, e.what());
  }
}

Result<std::string> LocalSessionClient::fetch_chunk(int64_t id, int64_t offset, int64_t limit) {
  try {
    auto rec = store_->findObject(id);
    if (!rec) return make_error(ErrorKind::ObjectNotFound, "File not found");
    if (offset >= rec->size) return std::string();
    return fs_.read_range(rec->storage_path, offset, limit);
  } catch (const std::exception& e) {
    return make_error(ErrorKind::UpstreamFetchFailure, e.what());
  }
}

} // namespace sgw
