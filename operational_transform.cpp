// operational_transform.cpp
#include "operational_transform.hpp"

#include "collab_log.hpp"

#include <algorithm>
#include <iterator>

namespace collab {

std::size_t utf8_length(std::string_view text) {
  std::size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

std::size_t utf8_offset(std::string_view text, std::size_t index) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if ((c & 0xC0) != 0x80) {
      if (seen == index) {
        return i;
      }
      ++seen;
    }
  }
  return text.size();
}

std::size_t operation_span(const Operation &op) {
  switch (op.type) {
  case OperationType::Insert:
    return op.content ? utf8_length(*op.content) : 0;
  case OperationType::Delete:
    return op.length.value_or(0);
  case OperationType::Retain:
  case OperationType::Format:
    break;
  }
  return 0;
}

std::string apply_operation(const std::string &text, const Operation &op) {
  switch (op.type) {
  case OperationType::Insert: {
    if (!op.content || op.content->empty()) {
      return text;
    }
    std::string result = text;
    result.insert(utf8_offset(text, op.position), *op.content);
    return result;
  }
  case OperationType::Delete: {
    std::size_t count = op.length.value_or(0);
    if (count == 0) {
      return text;
    }
    std::size_t begin = utf8_offset(text, op.position);
    std::size_t end = utf8_offset(text, op.position + count);
    std::string result = text;
    result.erase(begin, end - begin);
    return result;
  }
  case OperationType::Retain:
  case OperationType::Format:
    break;
  }
  return text;
}

Operation transform_operation(const Operation &remote, const Operation &local) {
  Operation result = local;
  if (local.type != OperationType::Insert) {
    return result;
  }

  if (remote.type == OperationType::Insert) {
    if (remote.position <= local.position) {
      result.position += operation_span(remote);
    }
  } else if (remote.type == OperationType::Delete) {
    if (remote.position < local.position) {
      std::size_t shift = operation_span(remote);
      result.position = local.position > shift ? local.position - shift : 0;
    }
  }
  return result;
}

void transform_pending_operations(std::vector<Operation> &pending, const Operation &incoming) {
  for (auto &op : pending) {
    op = transform_operation(incoming, op);
  }
}

namespace {

// Folds `next` into `last` if they are contiguous edits of the same kind
bool try_fold(Operation &last, const Operation &next) {
  if (last.type != next.type || last.author_id != next.author_id) {
    return false;
  }

  if (last.type == OperationType::Insert) {
    if (!last.content || !next.content) {
      return false;
    }
    if (last.position + utf8_length(*last.content) != next.position) {
      return false;
    }
    *last.content += *next.content;
    return true;
  }

  if (last.type == OperationType::Delete) {
    std::size_t last_len = last.length.value_or(0);
    std::size_t next_len = next.length.value_or(0);
    if (next.position == last.position) {
      last.length = last_len + next_len;
      return true;
    }
    if (next.position + next_len == last.position) {
      last.position = next.position;
      last.length = last_len + next_len;
      return true;
    }
  }
  return false;
}

} // namespace

std::vector<Operation> compose_operations(const std::vector<Operation> &ops) {
  std::vector<Operation> composed;
  composed.reserve(ops.size());
  for (const auto &op : ops) {
    if (!composed.empty() && try_fold(composed.back(), op)) {
      continue;
    }
    composed.push_back(op);
  }
  return composed;
}

// -----------------------------------------
// DocumentState
// -----------------------------------------

DocumentState::DocumentState(std::string text, std::size_t log_limit)
    : confirmed_(std::move(text)), log_limit_(std::max<std::size_t>(log_limit, 1)) {}

std::string DocumentState::tentative_text() const {
  std::string text = confirmed_;
  for (const auto &p : pending_) {
    text = apply_operation(text, p.op);
  }
  return text;
}

void DocumentState::add_local(Operation op) { pending_.push_back(PendingOp{std::move(op), false, false}); }

Operation DocumentState::rebase_remote(const Operation &op) const {
  Version from = op.base_version;
  if (from < log_start_) {
    log_warn("operation " + op.id + " is based on revision " + std::to_string(from) +
             ", older than the retained log; rebasing from " + std::to_string(log_start_));
    from = log_start_;
  }

  Operation rebased = op;
  for (Version r = from; r < revision_; ++r) {
    const Operation &seen = log_[static_cast<std::size_t>(r - log_start_)];
    if (seen.author_id != op.author_id) {
      rebased = transform_operation(seen, rebased);
    }
  }
  return rebased;
}

void DocumentState::confirm(const Operation &applied) {
  confirmed_ = apply_operation(confirmed_, applied);
  log_.push_back(applied);
  applied_ids_.insert(applied.id);
  ++revision_;

  while (log_.size() > log_limit_) {
    applied_ids_.erase(log_.front().id);
    log_.pop_front();
    ++log_start_;
  }
}

bool DocumentState::apply_remote(const Operation &op) {
  if (was_applied(op.id)) {
    return false;
  }

  Operation rebased = rebase_remote(op);
  std::vector<Operation> ops = pending_operations();
  transform_pending_operations(ops, rebased);
  for (std::size_t i = 0; i < ops.size(); ++i) {
    pending_[i].op = std::move(ops[i]);
  }
  confirm(rebased);
  return true;
}

bool DocumentState::acknowledge(const std::string &op_id) {
  auto it = std::find_if(pending_.begin(), pending_.end(), [&](const PendingOp &p) { return p.op.id == op_id; });
  if (it == pending_.end()) {
    return false;
  }
  if (it != pending_.begin()) {
    log_debug("operation " + op_id + " acknowledged out of order");
  }

  Operation applied = it->op;
  pending_.erase(it);
  confirm(applied);
  return true;
}

bool DocumentState::is_pending(const std::string &op_id) const {
  return std::any_of(pending_.begin(), pending_.end(), [&](const PendingOp &p) { return p.op.id == op_id; });
}

std::vector<Operation> DocumentState::compose_untransmitted(std::size_t max_ops) {
  auto first = std::find_if(pending_.begin(), pending_.end(), [](const PendingOp &p) { return !p.transmitted; });
  if (first == pending_.end() || max_ops == 0) {
    return {};
  }

  if (first->resend) {
    first->op.base_version = revision_;
    return {first->op};
  }

  auto available = static_cast<std::size_t>(std::distance(first, pending_.end()));
  auto limit = first + static_cast<std::ptrdiff_t>(std::min(max_ops, available));
  auto last = std::find_if(first, limit, [](const PendingOp &p) { return p.resend; });

  std::vector<Operation> batch;
  for (auto it = first; it != last; ++it) {
    batch.push_back(it->op);
  }
  std::vector<Operation> composed = compose_operations(batch);
  for (auto &op : composed) {
    op.base_version = revision_;
  }

  auto insert_at = pending_.erase(first, last);
  for (auto it = composed.rbegin(); it != composed.rend(); ++it) {
    insert_at = pending_.insert(insert_at, PendingOp{*it, false, false});
  }
  return composed;
}

bool DocumentState::mark_transmitted(const std::string &op_id) {
  for (auto &p : pending_) {
    if (p.op.id == op_id) {
      p.transmitted = true;
      p.resend = false;
      return true;
    }
  }
  return false;
}

std::size_t DocumentState::requeue_transmitted() {
  std::size_t marked = 0;
  for (auto &p : pending_) {
    if (p.transmitted) {
      p.transmitted = false;
      p.resend = true;
      ++marked;
    }
  }
  return marked;
}

std::vector<Operation> DocumentState::pending_operations() const {
  std::vector<Operation> ops;
  ops.reserve(pending_.size());
  for (const auto &p : pending_) {
    ops.push_back(p.op);
  }
  return ops;
}

std::size_t DocumentState::untransmitted_count() const {
  return static_cast<std::size_t>(
      std::count_if(pending_.begin(), pending_.end(), [](const PendingOp &p) { return !p.transmitted; }));
}

void DocumentState::reset(std::string text) {
  confirmed_ = std::move(text);
  pending_.clear();
  log_.clear();
  applied_ids_.clear();
  log_start_ = revision_;
}

} // namespace collab
