/*
 * Copyright (C) 2021 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#include <lodging/GuestDirectory.hpp>
#include <lodging/Hotel.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>

using namespace lodging;

//==============================================================================
struct FrontDesk
{
  std::shared_ptr<reservations::SimulatedPaymentGateway> gateway;
  Hotel hotel;
  GuestDirectory guests;
  std::optional<Guest> current;
};

//==============================================================================
Date today()
{
  return local_date(
    std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

//==============================================================================
std::string read_line(const std::string& prompt)
{
  std::cout << prompt << std::flush;
  std::string line;
  if (!std::getline(std::cin, line))
    return "";

  return line;
}

//==============================================================================
std::optional<int> read_choice(const std::string& prompt)
{
  const std::string line = read_line(prompt);
  try
  {
    std::size_t used = 0;
    const int choice = std::stoi(line, &used);
    if (used == line.size())
      return choice;
  }
  catch (const std::logic_error&)
  {
    // Falls through to the message below
  }

  std::cout << "Invalid input. Please enter a number." << std::endl;
  return std::nullopt;
}

//==============================================================================
std::optional<Date> read_date(const std::string& prompt)
{
  const auto date = parse_date(read_line(prompt));
  if (!date)
    std::cout << "Invalid date format. Please use YYYY-MM-DD." << std::endl;

  return date;
}

//==============================================================================
void print(const ConstRoomPtr& room)
{
  const auto& info = describe(room->category());
  std::cout << "Room " << room->number() << " (" << info.display_name
            << ") - $" << room->price_per_night().to_string()
            << "/night, Capacity: " << room->capacity() << std::endl;
}

//==============================================================================
void print(const reservations::Reservation& reservation)
{
  const auto& room = reservation.room();
  std::cout << "Booking ID: " << reservation.booking_id() << "\n"
            << "Room: " << room->number() << " ("
            << describe(room->category()).display_name << ")\n"
            << "Check-in: " << to_string(reservation.check_in()) << "\n"
            << "Check-out: " << to_string(reservation.check_out()) << "\n"
            << "Nights: " << reservation.nights() << "\n"
            << "Total Amount: $" << reservation.total_amount().to_string()
            << "\n"
            << "Status: " << to_string(reservation.status()) << std::endl;
}

//==============================================================================
void register_guest(FrontDesk& desk)
{
  const std::string username = read_line("Enter username: ");
  const std::string password = read_line("Enter password: ");

  const auto guest = desk.guests.register_guest(username, password);
  if (!guest)
  {
    std::cout << guest.error().message() << std::endl;
    return;
  }

  std::cout << "User " << guest->username() << " registered successfully "
            << "with ID: " << guest->id() << std::endl;
}

//==============================================================================
void login(FrontDesk& desk)
{
  const std::string username = read_line("Enter username: ");
  const std::string password = read_line("Enter password: ");

  const auto guest = desk.guests.login(username, password);
  if (!guest)
  {
    std::cout << guest.error().message() << std::endl;
    return;
  }

  std::cout << "Login successful for " << guest->username() << std::endl;
  desk.current = *guest;
}

//==============================================================================
void search_and_book(FrontDesk& desk)
{
  std::cout << "\n--- Search and Book Room ---" << std::endl;
  std::cout << "Available categories:";
  for (const auto category : all_categories())
    std::cout << " " << to_string(category);
  std::cout << std::endl;

  const auto category = parse_category(read_line("Enter room category: "));
  if (!category)
  {
    std::cout << "Invalid room category. Please try again." << std::endl;
    return;
  }

  const auto check_in = read_date("Enter Check-in Date (YYYY-MM-DD): ");
  if (!check_in)
    return;

  const auto check_out = read_date("Enter Check-out Date (YYYY-MM-DD): ");
  if (!check_out)
    return;

  const auto rooms = desk.hotel.search(*category, *check_in, *check_out);
  if (!rooms)
  {
    std::cout << "Invalid dates. " << rooms.error().message() << std::endl;
    return;
  }

  if (rooms->empty())
  {
    std::cout << "No rooms of type " << describe(*category).display_name
              << " available for the selected dates." << std::endl;
    return;
  }

  std::cout << "\nAvailable Rooms:" << std::endl;
  for (std::size_t i = 0; i < rooms->size(); ++i)
  {
    std::cout << (i + 1) << ". ";
    print(rooms->at(i));
  }

  const auto choice = read_choice(
    "Enter the number of the room you want to book (0 to cancel): ");
  if (!choice || *choice == 0)
    return;

  if (*choice < 0 || static_cast<std::size_t>(*choice) > rooms->size())
  {
    std::cout << "Invalid room choice." << std::endl;
    return;
  }

  const auto& room = rooms->at(static_cast<std::size_t>(*choice - 1));
  const Money total =
    room->price_per_night() * nights_between(*check_in, *check_out);
  std::cout << "Processing payment of $" << total.to_string() << "..."
            << std::endl;

  const auto reservation =
    desk.hotel.reserve(*desk.current, room, *check_in, *check_out);
  if (!reservation)
  {
    std::cout << reservation.error().message() << std::endl;
    return;
  }

  std::cout << "Payment successful!\n"
            << "Reservation successful! Booking ID: "
            << reservation->booking_id() << std::endl;
}

//==============================================================================
void view_my_bookings(const FrontDesk& desk)
{
  std::cout << "\n--- My Bookings ---" << std::endl;
  const auto bookings = desk.hotel.list_by_guest(desk.current->id());
  if (bookings.empty())
  {
    std::cout << "You have no bookings." << std::endl;
    return;
  }

  for (const auto& booking : bookings)
  {
    print(booking);
    std::cout << "--------------------" << std::endl;
  }
}

//==============================================================================
void view_booking(const FrontDesk& desk)
{
  const std::string booking_id = read_line("Enter Booking ID: ");
  const auto booking = desk.hotel.get(booking_id);
  if (!booking)
  {
    std::cout << booking.error().message() << "." << std::endl;
    return;
  }

  std::cout << "\n--- Booking Details ---" << std::endl;
  print(*booking);
}

//==============================================================================
void cancel_booking(FrontDesk& desk)
{
  const std::string booking_id = read_line("Enter Booking ID to cancel: ");
  const auto cancellation = desk.hotel.cancel(booking_id);
  if (!cancellation)
  {
    std::cout << cancellation.error().message() << "." << std::endl;
    return;
  }

  if (*cancellation == Hotel::Cancellation::AlreadyCancelled)
  {
    std::cout << "Booking " << booking_id << " is already cancelled."
              << std::endl;
    return;
  }

  std::cout << "Booking " << booking_id << " cancelled successfully."
            << std::endl;
}

//==============================================================================
void main_menu(FrontDesk& desk)
{
  std::cout << "\n--- Main Menu (Logged in as: " << desk.current->username()
            << ") ---\n"
            << "1. Search and Book Room\n"
            << "2. View My Bookings\n"
            << "3. View Booking Details by ID\n"
            << "4. Cancel Booking\n"
            << "5. Logout" << std::endl;

  const auto choice = read_choice("Enter your choice: ");
  if (!choice)
    return;

  switch (*choice)
  {
    case 1: search_and_book(desk); return;
    case 2: view_my_bookings(desk); return;
    case 3: view_booking(desk); return;
    case 4: cancel_booking(desk); return;
    case 5:
    {
      desk.current.reset();
      std::cout << "Logged out successfully." << std::endl;
      return;
    }
  }

  std::cout << "Invalid choice. Please try again." << std::endl;
}

//==============================================================================
/// Returns false when the user chose to exit.
bool authentication_menu(FrontDesk& desk)
{
  std::cout << "\n--- Authentication Menu ---\n"
            << "1. Register\n"
            << "2. Login\n"
            << "3. Exit" << std::endl;

  const auto choice = read_choice("Enter your choice: ");
  if (!choice)
    return true;

  switch (*choice)
  {
    case 1: register_guest(desk); return true;
    case 2: login(desk); return true;
    case 3:
    {
      std::cout << "Thank you for using the system. Goodbye!" << std::endl;
      return false;
    }
  }

  std::cout << "Invalid choice. Please try again." << std::endl;
  return true;
}

//==============================================================================
int main()
{
  auto gateway = std::make_shared<reservations::SimulatedPaymentGateway>();
  FrontDesk desk{
    gateway,
    Hotel(gateway, Hotel::Configuration().earliest_check_in(today())),
    GuestDirectory(),
    std::nullopt
  };
  make_default_inventory(desk.hotel);

  std::cout << "Welcome to the Hotel Reservation System!" << std::endl;
  while (std::cin)
  {
    if (desk.current.has_value())
    {
      main_menu(desk);
      continue;
    }

    if (!authentication_menu(desk))
      break;
  }

  return 0;
}
