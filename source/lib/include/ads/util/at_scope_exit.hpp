#pragma once

#include <utility>

// Runs the given function when leaving the enclosing scope
template<class FunT>
class AtScopeExit
{
  public:
    AtScopeExit(FunT fun)
        : m_Fun{ std::move(fun) }
    {
    }
    ~AtScopeExit()
    {
        m_Fun();
    }

    AtScopeExit(const AtScopeExit&) = delete;
    AtScopeExit(AtScopeExit&&) = delete;
    AtScopeExit& operator=(const AtScopeExit&) = delete;
    AtScopeExit& operator=(AtScopeExit&&) = delete;

  private:
    FunT m_Fun;
};
