#pragma once

namespace migration {

/**
 * Installs or discards the data staged by a migration session.
 */
class CommitCoordinator {
 public:
  virtual ~CommitCoordinator() = default;

  /**
   * Replaces the live account with the staged one. Nothing is modified if
   * a staged item is missing or invalid.
   * @return  true if the staged account was installed.
   */
  virtual bool commit() = 0;

  /**
   * Removes every staged item. The live account is left untouched.
   */
  virtual void cancel() = 0;
};

} // namespace migration
