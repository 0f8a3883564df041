#pragma once

namespace baton::db {

/*
  One atomic unit of coordination state: a session's groups, its event log
  and the derived state rows change together or not at all.

  Every backend provides:
    - writes stay private to the open transaction until Commit()
    - a failed Commit() leaves the committed state untouched and the
      transaction finished (rolled back)
    - destroying an unfinished transaction rolls it back
    - transactions on one repository run one at a time; opening a second
      one waits for the first to finish

  Commit() and Rollback() on a finished transaction: Commit() throws,
  Rollback() is a no-op.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace baton::db
