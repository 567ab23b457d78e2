#pragma once

#include <lazy/forward_decls.hpp>
#include <boost/variant.hpp>
#include <functional>
#include <type_traits>
#include <utility>

namespace lazy {

/*! \brief A result that's either already known or computed on demand.
 *
 * A value holds exactly one of two things. Either it holds an 'immediate'
 * result that was handed to it when it was built, or it holds a 'computation',
 * a function taking no arguments that produces the result.
 *
 * Which of the two is held is decided at construction and never changes. The
 * computation is never called during construction. It's called by get(), and
 * it's called again every time get() is called. Nothing is remembered between
 * calls, so a function with side effects has those side effects once per
 * get().
 *
 * A default constructed value holds an immediate, value-initialized
 * ResultType. Calling get() on it is perfectly fine.
 *
 * ResultType must be copy constructible, even for a value that only ever holds
 * a computation. get() is generated for both alternatives, and the immediate
 * one returns a copy.
 *
 * ~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto later = ::lazy::make_lazy([]() { return expensive(); });
 * // expensive() hasn't been called yet.
 * int result = later.get();
 * ~~~~~~~~~~~~~~~~~~~
 */
template <typename ResultType>
class value {
   static_assert(!::std::is_void<ResultType>::value,
                 "A deferred value with no result is meaningless.");
   static_assert(!::std::is_reference<ResultType>::value,
                 "A deferred value holds its result by value.");

 public:
   typedef ResultType result_t;
   typedef ::std::function<ResultType()> thunk_t;

   //! Selects the constructor that holds a computation.
   struct computation_tag {
   };

   //! Holds a value-initialized ResultType.
   value() : held_() { }

   //! Holds a copy of val.
   explicit value(const ResultType &val) : held_(immediate(val)) { }

   //! Holds val, moved in.
   explicit value(ResultType &&val) : held_(immediate(::std::move(val))) { }

   /*! \brief Holds a computation that will be called by get().
    *
    * thunk is not called here. An empty thunk is held like any other, and
    * get() throws ::std::bad_function_call when it tries to call it.
    */
   value(const computation_tag &, thunk_t thunk)
        : held_(computation(::std::move(thunk)))
   {
   }

   /*! \brief Fetch the result.
    *
    * An immediate result is returned as a copy. A computation is called and
    * its result returned. Anything the computation throws is thrown from here
    * unchanged.
    */
   ResultType get() const {
      return ::boost::apply_visitor(get_visitor(), held_);
   }

   //! Does this hold a computation instead of an immediate result?
   bool is_lazy() const {
      return ::boost::get<computation>(&held_) != nullptr;
   }

 private:
   struct immediate {
      immediate() : val_() { }
      explicit immediate(const ResultType &val) : val_(val) { }
      explicit immediate(ResultType &&val) : val_(::std::move(val)) { }

      ResultType val_;
   };

   struct computation {
      explicit computation(thunk_t thunk) : thunk_(::std::move(thunk)) { }

      thunk_t thunk_;
   };

   class get_visitor : public ::boost::static_visitor<ResultType> {
    public:
      ResultType operator ()(const immediate &held) const {
         return held.val_;
      }
      ResultType operator ()(const computation &held) const {
         return held.thunk_();
      }
   };

   ::boost::variant<immediate, computation> held_;
};

//! Is T some kind of value<ResultType>?
template <typename T>
struct is_value : public ::std::false_type {
};

template <typename ResultType>
struct is_value<value<ResultType> > : public ::std::true_type {
};

/*! \brief Make a value holding an immediate result.
 *
 * The result type is the decayed type of val, which is copied or moved in.
 */
template <typename T>
value<typename ::std::decay<T>::type>
make_value(T &&val)
{
   typedef value<typename ::std::decay<T>::type> value_t;
   return value_t(::std::forward<T>(val));
}

/*! \brief Make a value holding a computation, see value.
 *
 * func can be anything that can be called with no arguments. Its result type
 * becomes the result type of the value. func is not called until get() is.
 */
template <typename FuncT>
value<typename ::std::decay<typename ::std::result_of<FuncT &()>::type>::type>
make_lazy(FuncT func)
{
   typedef typename ::std::result_of<FuncT &()>::type raw_result_t;
   typedef value<typename ::std::decay<raw_result_t>::type> value_t;
   return value_t(typename value_t::computation_tag(), ::std::move(func));
}

} // namespace lazy
