#pragma once

#include <lazy/value.hpp>
#include <type_traits>
#include <utility>

namespace lazy {

namespace priv {

/*! \brief The computation held by the value map returns.
 *
 * Owns its own copy of the source value and of the function. Every call
 * fetches the source again and applies the function to it again.
 */
template <typename ArgType, typename ResultType, typename FuncT>
class map_call {
 public:
   map_call(value<ArgType> source, FuncT func)
        : source_(::std::move(source)), func_(::std::move(func))
   {
   }

   ResultType operator ()() {
      return func_(source_.get());
   }

 private:
   value<ArgType> source_;
   FuncT func_;
};

} // namespace priv

/*! \brief Defer applying func to the result of source.
 *
 * The returned value always holds a computation. When its get() is called,
 * source.get() is called and func is applied to what it returns. Neither
 * happens before then, and both happen again on every get().
 *
 * ~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto doubled = ::lazy::map(::lazy::make_value(5),
 *                            [](int x) { return x * 2; });
 * doubled.get(); // 10
 * ~~~~~~~~~~~~~~~~~~~
 */
template <typename ArgType, typename FuncT>
value<typename ::std::decay<
         typename ::std::result_of<FuncT &(ArgType)>::type>::type>
map(value<ArgType> source, FuncT func)
{
   typedef typename ::std::decay<
      typename ::std::result_of<FuncT &(ArgType)>::type>::type result_t;
   typedef value<result_t> value_t;
   typedef priv::map_call<ArgType, result_t, FuncT> call_t;

   return value_t(typename value_t::computation_tag(),
                  call_t(::std::move(source), ::std::move(func)));
}

} // namespace lazy
