#pragma once

#include <lazy/value.hpp>
#include <type_traits>
#include <utility>

namespace lazy {

namespace priv {

template <typename ArgType, typename FuncT>
struct flat_map_traits {
   typedef typename ::std::decay<
      typename ::std::result_of<FuncT &(ArgType)>::type>::type inner_t;

   static_assert(is_value<inner_t>::value,
                 "flat_map needs a function that returns a ::lazy::value.");

   typedef typename inner_t::result_t result_t;
};

/*! \brief The computation held by the value flat_map returns.
 *
 * Fetches the source, hands it to the function, then fetches whatever value
 * the function returned. All three steps happen on every call. The returned
 * value is fetched with get() no matter what it holds.
 */
template <typename ArgType, typename ResultType, typename FuncT>
class flat_map_call {
 public:
   flat_map_call(value<ArgType> source, FuncT func)
        : source_(::std::move(source)), func_(::std::move(func))
   {
   }

   ResultType operator ()() {
      return func_(source_.get()).get();
   }

 private:
   value<ArgType> source_;
   FuncT func_;
};

} // namespace priv

/*! \brief Defer applying a function that itself returns a value, and fetch
 *  the result of that.
 *
 * This is map for functions returning value<R>. Instead of a value<value<R>>
 * you get a value<R>. Nothing is called until get() is called on the result.
 */
template <typename ArgType, typename FuncT>
value<typename priv::flat_map_traits<ArgType, FuncT>::result_t>
flat_map(value<ArgType> source, FuncT func)
{
   typedef typename priv::flat_map_traits<ArgType, FuncT>::result_t result_t;
   typedef value<result_t> value_t;
   typedef priv::flat_map_call<ArgType, result_t, FuncT> call_t;

   return value_t(typename value_t::computation_tag(),
                  call_t(::std::move(source), ::std::move(func)));
}

} // namespace lazy
