// operational_transform.hpp
#ifndef COLLAB_OPERATIONAL_TRANSFORM_HPP
#define COLLAB_OPERATIONAL_TRANSFORM_HPP

#include "collab_types.hpp"

#include <deque>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace collab {

/// Number of code points in a UTF-8 string.
std::size_t utf8_length(std::string_view text);

/// Byte offset of code point `index` in `text`, clamped to text.size().
std::size_t utf8_offset(std::string_view text, std::size_t index);

/// Characters an operation inserts (insert) or removes (delete); 0 otherwise.
std::size_t operation_span(const Operation &op);

/// Applies a single operation to `text`.
///
/// Insert splices content at position; delete removes `length` characters at
/// position; retain and format leave the text unchanged. Positions past the
/// end clamp to the end, and a delete never runs past it.
std::string apply_operation(const std::string &text, const Operation &op);

/// Rewrites `local` so it applies after `remote`.
///
/// Only two pairings move anything:
/// - insert vs insert: remote.position <= local.position shifts local right
///   by the remote content length
/// - delete vs insert: remote.position < local.position shifts local left by
///   the remote length, clamped at 0
/// Every other pairing returns `local` unchanged.
Operation transform_operation(const Operation &remote, const Operation &local);

/// Rewrites every operation of `pending`, in order, against `incoming`.
void transform_pending_operations(std::vector<Operation> &pending, const Operation &incoming);

/// Folds adjacent, same-type, same-author, contiguous operations.
///
/// Inserts merge when the second starts where the first ends. Deletes merge
/// when the second is at the same position (forward delete) or ends where the
/// first starts (backspace). The merged operation keeps the first one's id.
std::vector<Operation> compose_operations(const std::vector<Operation> &ops);

/// Shared text document as one client sees it.
///
/// The confirmed text holds operations in relay order. Local operations sit
/// in a pending queue until their echo comes back; the tentative text is the
/// confirmed text with the pending queue applied on top.
///
/// Operation::base_version is the document revision (number of confirmed
/// operations) its author had seen. A remote operation is rewritten against
/// the confirmed operations it had not seen before it is applied, so every
/// client applies the same rewritten form.
class DocumentState {
public:
  explicit DocumentState(std::string text = {}, std::size_t log_limit = 1000);

  const std::string &confirmed_text() const { return confirmed_; }
  std::string tentative_text() const;

  /// Number of operations applied to the confirmed text.
  Version revision() const { return revision_; }

  /// Queues a locally authored operation (not yet transmitted).
  void add_local(Operation op);

  /// Applies an operation authored elsewhere. Pending operations are rewritten
  /// against it. Returns false if its id was already applied.
  bool apply_remote(const Operation &op);

  /// Moves an echoed local operation from the pending queue into the
  /// confirmed text. Returns false for an id that is not pending.
  bool acknowledge(const std::string &op_id);

  bool is_pending(const std::string &op_id) const;
  bool was_applied(const std::string &op_id) const { return applied_ids_.count(op_id) != 0; }

  /// Composes up to `max_ops` untransmitted operations in place and returns
  /// the composed result (still untransmitted), stamped with the current revision.
  std::vector<Operation> compose_untransmitted(std::size_t max_ops);

  bool mark_transmitted(const std::string &op_id);

  /// Marks every transmitted, unacknowledged operation for sending again, as
  /// after a reconnect when the relay may never have received them. Each is
  /// resent on its own, never composed, so receivers can drop it by id.
  /// Returns how many were marked.
  std::size_t requeue_transmitted();

  std::vector<Operation> pending_operations() const;
  std::size_t pending_count() const { return pending_.size(); }
  std::size_t untransmitted_count() const;

  void clear_pending() { pending_.clear(); }

  /// Replaces the confirmed text and drops all pending and logged operations.
  void reset(std::string text);

private:
  struct PendingOp {
    Operation op;
    bool transmitted = false;
    bool resend = false;
  };

  void confirm(const Operation &applied);
  Operation rebase_remote(const Operation &op) const;

  std::string confirmed_;
  std::deque<PendingOp> pending_;
  std::deque<Operation> log_; // confirmed operations, oldest first
  Version log_start_ = 0;     // revision of log_.front()
  Version revision_ = 0;
  std::unordered_set<std::string> applied_ids_;
  std::size_t log_limit_;
};

} // namespace collab

#endif // COLLAB_OPERATIONAL_TRANSFORM_HPP
