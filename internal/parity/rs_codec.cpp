#include "rs_codec.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/staging_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"

namespace optiraid::parity {

using storage::common::TempPathFor;
using storage::common::Unwrap;

namespace {

struct Column {
  std::shared_ptr<arrow::io::ReadableFile> file;
  std::uint64_t                            size = 0;
};

// Reads [offset, offset + length) of a column, zero-padding past its end.
void ReadColumn(const Column& column, std::uint64_t offset, std::uint64_t length, std::vector<std::uint8_t>& out) {
  out.assign(length, 0);
  if (offset >= column.size) return;

  const auto available = std::min(length, column.size - offset);
  auto       buffer    = Unwrap(column.file->ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(available)));
  if (static_cast<std::uint64_t>(buffer->size()) != available) {
    throw util::IntegrityFailure("short read from parity input");
  }
  std::copy(buffer->data(), buffer->data() + buffer->size(), out.begin());
}

// Writes every output to a temporary name and publishes them together.
class OutputSet {
 public:
  explicit OutputSet(std::vector<std::filesystem::path> finals) : finals_(std::move(finals)) {
    streams_.reserve(finals_.size());
    for (const auto& path : finals_) {
      streams_.push_back(storage::OpenOutput(TempPathFor(path)));
    }
  }

  ~OutputSet() {
    if (published_) return;
    for (auto& stream : streams_) {
      if (!stream->closed()) {
        auto status = stream->Close();
        (void)status;
      }
    }
    for (const auto& path : finals_) {
      std::error_code ec;
      std::filesystem::remove(TempPathFor(path), ec);
    }
  }

  void Write(std::size_t index, const std::vector<std::uint8_t>& data, std::uint64_t length) {
    Unwrap(streams_[index]->Write(data.data(), static_cast<int64_t>(length)));
  }

  void Publish() {
    for (auto& stream : streams_) {
      Unwrap(stream->Flush());
      Unwrap(stream->Close());
    }
    for (const auto& path : finals_) {
      std::filesystem::rename(TempPathFor(path), path);
    }
    published_ = true;
  }

 private:
  std::vector<std::filesystem::path>                        finals_;
  std::vector<std::shared_ptr<arrow::io::FileOutputStream>> streams_;
  bool                                                      published_ = false;
};

} // namespace

ReedSolomonCodec::ReedSolomonCodec(std::uint64_t chunk_bytes) : chunk_bytes_(chunk_bytes) {
  if (chunk_bytes_ == 0) throw std::invalid_argument("chunk size must be positive");
}

gf256::Matrix ReedSolomonCodec::CauchyMatrix(std::uint32_t data, std::uint32_t parity) {
  if (data + parity > kMaxColumns) {
    throw util::ConfigurationError("reed-solomon supports at most " + std::to_string(kMaxColumns) + " members per set");
  }

  gf256::Matrix matrix(parity, std::vector<std::uint8_t>(data, 0));
  for (std::uint32_t i = 0; i < parity; ++i) {
    for (std::uint32_t j = 0; j < data; ++j) {
      matrix[i][j] = gf256::Inv(static_cast<std::uint8_t>((data + i) ^ j));
    }
  }
  return matrix;
}

ParityResult ReedSolomonCodec::Plan(const ParityRequest& request) const {
  ParityResult result;
  if (!request.input_sizes.empty()) {
    result.shard_length = *std::max_element(request.input_sizes.begin(), request.input_sizes.end());
  }

  for (std::uint32_t i = 0; i < request.parity; ++i) {
    model::ParityShard shard;
    shard.name       = util::ParityShardName(request.basename, request.set_index, i + 1, request.digits);
    shard.path       = request.output_dir / shard.name;
    shard.size_bytes = result.shard_length;
    shard.position   = i;
    shard.role       = v1::MEMBER_ROLE_PARITY;
    result.outputs.push_back(std::move(shard));
  }
  return result;
}

ParityResult ReedSolomonCodec::Generate(const ParityRequest& request) {
  if (request.inputs.size() != request.input_sizes.size() || request.inputs.empty()) {
    throw std::invalid_argument("parity request needs one size per input");
  }

  auto       result = Plan(request);
  const auto matrix = CauchyMatrix(static_cast<std::uint32_t>(request.inputs.size()), request.parity);

  std::vector<Column> columns;
  for (std::size_t j = 0; j < request.inputs.size(); ++j) {
    columns.push_back({storage::OpenInput(request.inputs[j]), request.input_sizes[j]});
  }

  std::vector<std::filesystem::path> paths;
  for (const auto& shard : result.outputs) paths.push_back(shard.path);
  OutputSet outputs(paths);

  std::vector<std::uint8_t>              column_chunk;
  std::vector<std::vector<std::uint8_t>> parity_chunks(request.parity);

  for (std::uint64_t offset = 0; offset < result.shard_length; offset += chunk_bytes_) {
    const auto length = std::min(chunk_bytes_, result.shard_length - offset);
    for (auto& chunk : parity_chunks) chunk.assign(length, 0);

    for (std::size_t j = 0; j < columns.size(); ++j) {
      ReadColumn(columns[j], offset, length, column_chunk);
      for (std::uint32_t i = 0; i < request.parity; ++i) {
        gf256::MulAddRegion(parity_chunks[i].data(), column_chunk.data(), matrix[i][j], length);
      }
    }

    for (std::uint32_t i = 0; i < request.parity; ++i) {
      outputs.Write(i, parity_chunks[i], length);
    }
  }

  outputs.Publish();
  OPTIRAID_LOG_DEBUG("reed-solomon parity written", {observability::IntField("set", static_cast<std::int64_t>(request.set_index)),
                                                     observability::IntField("shard_length", static_cast<std::int64_t>(result.shard_length))});
  return result;
}

void ReedSolomonCodec::Repair(const RepairRequest& request) {
  if (!request.manifest) throw std::invalid_argument("repair request without manifest");
  const auto& manifest = *request.manifest;

  std::map<std::uint32_t, const v1::MemberEntry*> data;
  std::map<std::uint32_t, const v1::MemberEntry*> parity;
  for (const auto& member : manifest.members()) {
    if (member.role() == v1::MEMBER_ROLE_DATA) data[member.position()] = &member;
    if (member.role() == v1::MEMBER_ROLE_PARITY) parity[member.position()] = &member;
  }

  const std::set<std::string> damaged(request.damaged.begin(), request.damaged.end());
  std::vector<std::uint32_t>  lost_data;
  std::vector<std::uint32_t>  lost_parity;
  std::vector<std::uint32_t>  intact_parity;
  for (const auto& [position, member] : data) {
    if (damaged.contains(member->name())) lost_data.push_back(position);
  }
  for (const auto& [position, member] : parity) {
    if (damaged.contains(member->name())) {
      lost_parity.push_back(position);
    } else {
      intact_parity.push_back(position);
    }
  }

  if (lost_data.size() > intact_parity.size()) {
    throw util::Unrecoverable(manifest.set_index(), lost_data.size() + lost_parity.size(), parity.size());
  }
  if (lost_data.empty() && lost_parity.empty()) return;

  const auto k      = static_cast<std::uint32_t>(data.size());
  const auto m      = static_cast<std::uint32_t>(parity.size());
  const auto matrix = CauchyMatrix(k, m);
  const auto length = manifest.shard_length();
  const auto e      = lost_data.size();

  // rows used to solve for the lost data columns
  std::vector<std::uint32_t> rows(intact_parity.begin(), intact_parity.begin() + static_cast<std::ptrdiff_t>(e));
  gf256::Matrix              sub(e, std::vector<std::uint8_t>(e, 0));
  for (std::size_t r = 0; r < e; ++r) {
    for (std::size_t c = 0; c < e; ++c) {
      sub[r][c] = matrix[rows[r]][lost_data[c]];
    }
  }
  const auto solve = gf256::Invert(sub);

  std::map<std::uint32_t, Column> data_in;
  for (const auto& [position, member] : data) {
    if (damaged.contains(member->name())) continue;
    data_in[position] = {storage::OpenInput(request.dir / member->name()), member->size_bytes()};
  }
  std::map<std::uint32_t, Column> parity_in;
  for (auto row : rows) {
    parity_in[row] = {storage::OpenInput(request.dir / parity[row]->name()), parity[row]->size_bytes()};
  }

  std::vector<std::filesystem::path> paths;
  for (auto position : lost_data) paths.push_back(request.dir / data[position]->name());
  for (auto position : lost_parity) paths.push_back(request.dir / parity[position]->name());
  OutputSet outputs(paths);

  std::vector<std::uint8_t>              chunk;
  std::vector<std::vector<std::uint8_t>> syndromes(e);
  std::vector<std::vector<std::uint8_t>> rebuilt(e);
  std::vector<std::vector<std::uint8_t>> columns(k);

  for (std::uint64_t offset = 0; offset < length; offset += chunk_bytes_) {
    const auto len = std::min(chunk_bytes_, length - offset);

    for (const auto& [position, column] : data_in) {
      ReadColumn(column, offset, len, columns[position]);
    }

    // syndrome: parity row minus the contribution of the intact columns
    for (std::size_t r = 0; r < e; ++r) {
      ReadColumn(parity_in[rows[r]], offset, len, syndromes[r]);
      for (const auto& [position, column] : data_in) {
        gf256::MulAddRegion(syndromes[r].data(), columns[position].data(), matrix[rows[r]][position], len);
      }
    }

    for (std::size_t c = 0; c < e; ++c) {
      rebuilt[c].assign(len, 0);
      for (std::size_t r = 0; r < e; ++r) {
        gf256::MulAddRegion(rebuilt[c].data(), syndromes[r].data(), solve[c][r], len);
      }
      columns[lost_data[c]] = rebuilt[c];
    }

    // lost data members keep their own length, not the padded column length
    for (std::size_t c = 0; c < e; ++c) {
      const auto size = data[lost_data[c]]->size_bytes();
      if (offset < size) {
        outputs.Write(c, rebuilt[c], std::min<std::uint64_t>(len, size - offset));
      }
    }

    for (std::size_t p = 0; p < lost_parity.size(); ++p) {
      chunk.assign(len, 0);
      for (std::uint32_t j = 0; j < k; ++j) {
        gf256::MulAddRegion(chunk.data(), columns[j].data(), matrix[lost_parity[p]][j], len);
      }
      outputs.Write(e + p, chunk, len);
    }
  }

  outputs.Publish();
  OPTIRAID_LOG_INFO("reed-solomon repair complete", {observability::IntField("set", static_cast<std::int64_t>(manifest.set_index())),
                                                     observability::IntField("data_rebuilt", static_cast<std::int64_t>(lost_data.size())),
                                                     observability::IntField("parity_rebuilt", static_cast<std::int64_t>(lost_parity.size()))});
}

} // namespace optiraid::parity
